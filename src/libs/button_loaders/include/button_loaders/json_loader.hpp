#pragma once

#include <button_loaders/scene_desc.hpp>
#include <scene_graph/types.hpp>
#include <istream>
#include <optional>
#include <string>

namespace button_loaders {

std::optional<SceneDesc> load_scene_from_json(std::istream& in);
std::optional<SceneDesc> load_scene_from_json_file(const std::string& path);

// "#RRGGBB" or "#RRGGBBAA".
std::optional<scene_graph::Color> parse_color(const std::string& text);

} // namespace button_loaders
