#include <button_loaders/scene_builder.hpp>
#include <scene_graph/log.hpp>

namespace button_loaders {

std::shared_ptr<touch_button::Button> BuiltScene::button(const std::string& id) const {
    auto it = buttons.find(id);
    if (it == buttons.end()) return nullptr;
    return it->second;
}

std::shared_ptr<scene_graph::Node> build_visual(const VisualDesc& desc, const ButtonDesc& owner) {
    auto node = scene_graph::Node::create(scene_graph::Size{
        desc.width.value_or(owner.width), desc.height.value_or(owner.height) });
    node->set_shape(desc.shape);
    node->set_color(desc.color);
    node->set_label(desc.label);
    return node;
}

std::shared_ptr<touch_button::Button> build_button(const ButtonDesc& desc) {
    auto visual = [&](const std::optional<VisualDesc>& v, const char* suffix) -> std::shared_ptr<scene_graph::Node> {
        if (!v) return nullptr;
        auto node = build_visual(*v, desc);
        node->set_name(desc.id + "/" + suffix);
        return node;
    };

    auto button = touch_button::Button::create(scene_graph::Size{ desc.width, desc.height });
    button->set_name(desc.id);
    button->set_position(scene_graph::Point{ desc.x, desc.y });
    button->set_node_normal(visual(desc.normal, "normal"));
    button->set_node_highlighted(visual(desc.highlighted, "highlighted"));
    button->set_node_disabled(visual(desc.disabled, "disabled"));
    button->set_node_selected_normal(visual(desc.selected_normal, "selected_normal"));
    button->set_node_selected_highlighted(visual(desc.selected_highlighted, "selected_highlighted"));
    button->set_auto_toggle_selection(desc.auto_toggle_selection);
    button->set_enabled(desc.enabled);
    button->set_selected(desc.selected);
    button->update_state();
    return button;
}

BuiltScene build_scene(const SceneDesc& desc) {
    if (!desc.log_level.empty()) {
        if (auto level = scene_graph::parse_log_level(desc.log_level))
            scene_graph::set_log_level(*level);
    }

    BuiltScene out;
    out.root = scene_graph::Node::create();
    out.root->set_name(desc.name.empty() ? "scene" : desc.name);
    for (const auto& b : desc.buttons) {
        auto button = build_button(b);
        out.root->attach_child(button);
        if (!out.buttons.emplace(b.id, button).second)
            scene_graph::logger("button_loaders")->warn("duplicate button id '{}', lookup keeps the first", b.id);
    }
    return out;
}

} // namespace button_loaders
