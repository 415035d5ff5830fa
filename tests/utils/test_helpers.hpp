/**
 * @file test_helpers.hpp
 * @brief Shared fixtures for button and scene graph tests
 */

#pragma once

#include <scene_graph/node.hpp>
#include <scene_graph/touch.hpp>
#include <touch_button/button.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace button_kit_test {

// Records callbacks in the order they arrive.
class CallbackRecorder {
public:
    void on_down(touch_button::Button& sender) { record("down", sender); }
    void on_up_inside(touch_button::Button& sender) { record("up_inside", sender); }
    void on_up(touch_button::Button& sender) { record("up", sender); }

    std::vector<std::string> events;
    const touch_button::Button* last_sender = nullptr;

    int count(const std::string& event) const {
        int n = 0;
        for (const auto& e : events)
            if (e == event) ++n;
        return n;
    }

private:
    void record(const char* event, touch_button::Button& sender) {
        events.emplace_back(event);
        last_sender = &sender;
    }
};

// Counts the scene graph mutations made by update_state.
class CountingButton : public touch_button::Button {
public:
    using touch_button::Button::Button;

    void attach_child(std::shared_ptr<scene_graph::Node> child) override {
        ++attach_count;
        touch_button::Button::attach_child(std::move(child));
    }

    void detach_child(scene_graph::Node& child) override {
        ++detach_count;
        touch_button::Button::detach_child(child);
    }

    void reset_counts() {
        attach_count = 0;
        detach_count = 0;
    }

    int attach_count = 0;
    int detach_count = 0;
};

inline std::shared_ptr<scene_graph::Node> make_visual(const std::string& name) {
    auto node = scene_graph::Node::create(scene_graph::Size{ 10, 10 });
    node->set_name(name);
    return node;
}

inline scene_graph::Touch touch_at(double x, double y, scene_graph::TouchId id = 1) {
    return scene_graph::Touch{ id, scene_graph::Point{ x, y }, scene_graph::Point{ x, y } };
}

// Number of children of `button` that are one of its five appearance nodes.
inline int attached_appearance_count(const touch_button::Button& button) {
    int n = 0;
    for (auto a : { touch_button::Appearance::Normal, touch_button::Appearance::Highlighted,
                    touch_button::Appearance::Disabled, touch_button::Appearance::SelectedNormal,
                    touch_button::Appearance::SelectedHighlighted }) {
        const auto& node = button.node(a);
        if (node && button.has_child(*node)) ++n;
    }
    return n;
}

} // namespace button_kit_test
