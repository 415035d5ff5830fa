#pragma once

#include <scene_graph/node.hpp>
#include <scene_graph/touch.hpp>
#include <touch_button/target_action.hpp>
#include <array>
#include <cstddef>
#include <memory>
#include <optional>

namespace touch_button {

enum class Appearance {
    Normal,
    Highlighted,
    Disabled,
    SelectedNormal,
    SelectedHighlighted,
};

const char* to_string(Appearance appearance);

struct AppearanceNodes {
    std::shared_ptr<scene_graph::Node> normal;
    std::shared_ptr<scene_graph::Node> highlighted;
    std::shared_ptr<scene_graph::Node> disabled;
    std::shared_ptr<scene_graph::Node> selected_normal;
    std::shared_ptr<scene_graph::Node> selected_highlighted;
};

// A tappable button node.
//
// The button can be enabled and disabled. Its highlight follows the user's
// touch, and it can act as a toggle through its selected state. Assign visual
// nodes to the appearance slots after construction; the button attaches the
// one matching its state as its child and detaches the rest.
//
// Setting a slot does not refresh the display. Call update_state() once after
// configuring the slots, or build the button with create(size, nodes) which
// does it for you. The size is the touch area, centered on the position.
//
// At least the normal and highlighted nodes should be set, otherwise the button
// is invisible in those states. The disabled node only shows while enabled is
// false; the selected nodes only matter if the selected state is used.
class Button : public scene_graph::Node {
public:
    explicit Button(scene_graph::Size size);
    ~Button() override;

    static std::shared_ptr<Button> create(scene_graph::Size size);
    static std::shared_ptr<Button> create(scene_graph::Size size, AppearanceNodes nodes);

    // Which slot shows for a state combination. Disabled wins, then selected.
    static Appearance appearance_for(bool enabled, bool highlighted, bool selected);

    bool enabled() const { return enabled_; }
    void set_enabled(bool enabled);

    // True while a tracked touch is down inside the button.
    bool highlighted() const { return highlighted_; }

    bool selected() const { return selected_; }
    void set_selected(bool selected);

    // When set, a touch lifted inside the button flips the selected state.
    bool auto_toggle_selection() const { return auto_toggle_selection_; }
    void set_auto_toggle_selection(bool value) { auto_toggle_selection_ = value; }

    const std::shared_ptr<scene_graph::Node>& node(Appearance appearance) const;
    void set_node(Appearance appearance, std::shared_ptr<scene_graph::Node> node);

    const std::shared_ptr<scene_graph::Node>& node_normal() const { return node(Appearance::Normal); }
    void set_node_normal(std::shared_ptr<scene_graph::Node> n) { set_node(Appearance::Normal, std::move(n)); }
    const std::shared_ptr<scene_graph::Node>& node_highlighted() const { return node(Appearance::Highlighted); }
    void set_node_highlighted(std::shared_ptr<scene_graph::Node> n) { set_node(Appearance::Highlighted, std::move(n)); }
    const std::shared_ptr<scene_graph::Node>& node_disabled() const { return node(Appearance::Disabled); }
    void set_node_disabled(std::shared_ptr<scene_graph::Node> n) { set_node(Appearance::Disabled, std::move(n)); }
    const std::shared_ptr<scene_graph::Node>& node_selected_normal() const { return node(Appearance::SelectedNormal); }
    void set_node_selected_normal(std::shared_ptr<scene_graph::Node> n) { set_node(Appearance::SelectedNormal, std::move(n)); }
    const std::shared_ptr<scene_graph::Node>& node_selected_highlighted() const { return node(Appearance::SelectedHighlighted); }
    void set_node_selected_highlighted(std::shared_ptr<scene_graph::Node> n) { set_node(Appearance::SelectedHighlighted, std::move(n)); }

    Appearance current_appearance() const { return appearance_for(enabled_, highlighted_, selected_); }

    // The appearance node currently attached, or null.
    scene_graph::Node* displayed_node() const { return displayed_.get(); }

    // Called when a touch goes down inside the button.
    template <typename T>
    void set_touch_down_target(const std::shared_ptr<T>& target, void (T::*action)(Button&)) {
        touch_down_ = TargetAction<Button>(target, action);
    }
    void set_touch_down_target(std::nullptr_t) { touch_down_.reset(); }

    // Called when a touch goes up inside the button.
    template <typename T>
    void set_touch_up_inside_target(const std::shared_ptr<T>& target, void (T::*action)(Button&)) {
        touch_up_inside_ = TargetAction<Button>(target, action);
    }
    void set_touch_up_inside_target(std::nullptr_t) { touch_up_inside_.reset(); }

    // Called when a touch goes up, inside or outside the button.
    template <typename T>
    void set_touch_up_target(const std::shared_ptr<T>& target, void (T::*action)(Button&)) {
        touch_up_ = TargetAction<Button>(target, action);
    }
    void set_touch_up_target(std::nullptr_t) { touch_up_.reset(); }

    // Attaches the node for the current state and detaches the previous one.
    // Must be called once after the slots are configured.
    void update_state();

    bool is_tracking_touch() const { return tracked_touch_.has_value(); }

    void touch_began(const scene_graph::Touch& touch) override;
    void touch_moved(const scene_graph::Touch& touch) override;
    void touch_ended(const scene_graph::Touch& touch) override;
    void touch_cancelled(const scene_graph::Touch& touch) override;

private:
    void set_highlighted(bool highlighted);
    void fire(const TargetAction<Button>& target_action, const char* event);

    bool enabled_ = true;
    bool highlighted_ = false;
    bool selected_ = false;
    bool auto_toggle_selection_ = false;
    std::array<std::shared_ptr<scene_graph::Node>, 5> nodes_;
    std::shared_ptr<scene_graph::Node> displayed_;
    std::optional<scene_graph::TouchId> tracked_touch_;
    TargetAction<Button> touch_down_;
    TargetAction<Button> touch_up_inside_;
    TargetAction<Button> touch_up_;
};

} // namespace touch_button
