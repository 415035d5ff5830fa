#pragma once

#include <button_loaders/scene_desc.hpp>
#include <scene_graph/node.hpp>
#include <touch_button/button.hpp>
#include <memory>
#include <string>
#include <unordered_map>

namespace button_loaders {

struct BuiltScene {
    std::shared_ptr<scene_graph::Node> root;
    std::unordered_map<std::string, std::shared_ptr<touch_button::Button>> buttons;

    std::shared_ptr<touch_button::Button> button(const std::string& id) const;
};

std::shared_ptr<scene_graph::Node> build_visual(const VisualDesc& desc, const ButtonDesc& owner);

// The returned button already shows its initial appearance.
std::shared_ptr<touch_button::Button> build_button(const ButtonDesc& desc);

// Applies the scene's log level, then builds every button under a fresh root.
BuiltScene build_scene(const SceneDesc& desc);

} // namespace button_loaders
