#pragma once

#include <scene_graph/node.hpp>

struct ImDrawList;

namespace scene_render {

// Draws the node tree depth-first, parents under their children.
// Scene coordinates map to screen as scene * zoom + offset.
void render_scene(ImDrawList* draw_list, const scene_graph::Node& root,
    float offset_x, float offset_y, float zoom);

// Outlines the hit region of every node with user interaction enabled.
void render_hit_regions(ImDrawList* draw_list, const scene_graph::Node& root,
    float offset_x, float offset_y, float zoom);

} // namespace scene_render
