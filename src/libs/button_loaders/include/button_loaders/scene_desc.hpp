#pragma once

#include <scene_graph/node.hpp>
#include <scene_graph/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace button_loaders {

struct VisualDesc {
    scene_graph::Node::Shape shape = scene_graph::Node::Shape::Rectangle;
    scene_graph::Color color;
    std::string label;
    std::optional<double> width;  // defaults to the button's size
    std::optional<double> height;
};

struct ButtonDesc {
    std::string id;
    double x = 0;
    double y = 0;
    double width = 100;
    double height = 40;
    bool enabled = true;
    bool selected = false;
    bool auto_toggle_selection = false;
    std::optional<VisualDesc> normal;
    std::optional<VisualDesc> highlighted;
    std::optional<VisualDesc> disabled;
    std::optional<VisualDesc> selected_normal;
    std::optional<VisualDesc> selected_highlighted;
};

struct SceneDesc {
    std::string name;
    std::string log_level;  // empty keeps the current level
    std::vector<ButtonDesc> buttons;
};

} // namespace button_loaders
