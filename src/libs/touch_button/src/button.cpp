#include <touch_button/button.hpp>
#include <scene_graph/log.hpp>
#include <utility>

namespace touch_button {

namespace {

std::size_t slot(Appearance appearance) {
    return static_cast<std::size_t>(appearance);
}

std::shared_ptr<spdlog::logger> button_logger() {
    return scene_graph::logger("touch_button");
}

} // namespace

const char* to_string(Appearance appearance) {
    switch (appearance) {
    case Appearance::Normal: return "normal";
    case Appearance::Highlighted: return "highlighted";
    case Appearance::Disabled: return "disabled";
    case Appearance::SelectedNormal: return "selected_normal";
    case Appearance::SelectedHighlighted: return "selected_highlighted";
    }
    return "unknown";
}

Button::Button(scene_graph::Size size)
    : Node(size)
{
    set_user_interaction_enabled(true);
}

Button::~Button() = default;

std::shared_ptr<Button> Button::create(scene_graph::Size size) {
    return std::make_shared<Button>(size);
}

std::shared_ptr<Button> Button::create(scene_graph::Size size, AppearanceNodes nodes) {
    auto button = create(size);
    button->set_node_normal(std::move(nodes.normal));
    button->set_node_highlighted(std::move(nodes.highlighted));
    button->set_node_disabled(std::move(nodes.disabled));
    button->set_node_selected_normal(std::move(nodes.selected_normal));
    button->set_node_selected_highlighted(std::move(nodes.selected_highlighted));
    button->update_state();
    return button;
}

Appearance Button::appearance_for(bool enabled, bool highlighted, bool selected) {
    if (!enabled) return Appearance::Disabled;
    if (selected) return highlighted ? Appearance::SelectedHighlighted : Appearance::SelectedNormal;
    return highlighted ? Appearance::Highlighted : Appearance::Normal;
}

void Button::set_enabled(bool enabled) {
    if (enabled_ == enabled) return;
    enabled_ = enabled;
    button_logger()->debug("button '{}' enabled={}", name(), enabled_);
    update_state();
}

void Button::set_selected(bool selected) {
    if (selected_ == selected) return;
    selected_ = selected;
    button_logger()->debug("button '{}' selected={}", name(), selected_);
    update_state();
}

void Button::set_highlighted(bool highlighted) {
    if (highlighted_ == highlighted) return;
    highlighted_ = highlighted;
    update_state();
}

const std::shared_ptr<scene_graph::Node>& Button::node(Appearance appearance) const {
    return nodes_[slot(appearance)];
}

void Button::set_node(Appearance appearance, std::shared_ptr<scene_graph::Node> node) {
    nodes_[slot(appearance)] = std::move(node);
}

void Button::update_state() {
    const Appearance appearance = current_appearance();
    const std::shared_ptr<scene_graph::Node>& wanted = nodes_[slot(appearance)];

    const bool displayed_attached = displayed_ && has_child(*displayed_);
    if (wanted == displayed_ && (!displayed_ || displayed_attached)) return;

    if (displayed_attached) detach_child(*displayed_);
    displayed_ = wanted;
    if (displayed_) attach_child(displayed_);

    button_logger()->debug("button '{}' shows {}{}", name(), to_string(appearance),
        displayed_ ? "" : " (no node)");
}

void Button::fire(const TargetAction<Button>& target_action, const char* event) {
    if (target_action.empty()) return;
    if (!target_action(*this))
        button_logger()->debug("button '{}' {} target expired", name(), event);
}

void Button::touch_began(const scene_graph::Touch& touch) {
    if (tracked_touch_ || !enabled_) return;
    if (!contains_scene_point(touch.location)) return;

    // Holds the button while callbacks may detach or release it.
    auto keep_alive = weak_from_this().lock();
    tracked_touch_ = touch.id;
    set_highlighted(true);
    fire(touch_down_, "touch_down");
}

void Button::touch_moved(const scene_graph::Touch& touch) {
    if (!tracked_touch_ || *tracked_touch_ != touch.id || !enabled_) return;
    set_highlighted(contains_scene_point(touch.location));
}

void Button::touch_ended(const scene_graph::Touch& touch) {
    if (!tracked_touch_ || *tracked_touch_ != touch.id) return;
    tracked_touch_.reset();
    if (!enabled_) {
        set_highlighted(false);
        return;
    }

    auto keep_alive = weak_from_this().lock();
    const bool inside = contains_scene_point(touch.location);
    set_highlighted(false);
    if (auto_toggle_selection_ && inside) {
        selected_ = !selected_;
        update_state();
    }
    if (inside) fire(touch_up_inside_, "touch_up_inside");
    fire(touch_up_, "touch_up");
}

void Button::touch_cancelled(const scene_graph::Touch& touch) {
    if (!tracked_touch_ || *tracked_touch_ != touch.id) return;
    tracked_touch_.reset();
    button_logger()->debug("button '{}' touch cancelled", name());
    set_highlighted(false);
}

} // namespace touch_button
