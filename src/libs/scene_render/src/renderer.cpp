#include <scene_render/renderer.hpp>
#include "imgui.h"
#include <algorithm>
#include <cmath>

namespace scene_render {

namespace {

ImVec2 world_to_screen(double wx, double wy, float offset_x, float offset_y, float zoom) {
    return ImVec2((float)wx * zoom + offset_x, (float)wy * zoom + offset_y);
}

unsigned int to_im_color(const scene_graph::Color& c) {
    return IM_COL32(c.r, c.g, c.b, c.a);
}

unsigned int border_color(const scene_graph::Color& c) {
    auto lighten = [](std::uint8_t v) { return (int)std::min(255, v + 40); };
    return IM_COL32(lighten(c.r), lighten(c.g), lighten(c.b), c.a);
}

void draw_node(ImDrawList* draw_list, const scene_graph::Node& node,
    double parent_x, double parent_y, float offset_x, float offset_y, float zoom)
{
    const double cx = parent_x + node.position().x;
    const double cy = parent_y + node.position().y;
    const double w = node.size().width;
    const double h = node.size().height;
    const float line_thickness = 2.0f;
    const unsigned int text_color = IM_COL32(235, 235, 235, 255);

    ImVec2 min_pt = world_to_screen(cx - w * 0.5, cy - h * 0.5, offset_x, offset_y, zoom);
    ImVec2 max_pt = world_to_screen(cx + w * 0.5, cy + h * 0.5, offset_x, offset_y, zoom);

    switch (node.shape()) {
    case scene_graph::Node::Shape::Rectangle:
        draw_list->AddRectFilled(min_pt, max_pt, to_im_color(node.color()), 6.0f * zoom);
        draw_list->AddRect(min_pt, max_pt, border_color(node.color()), 6.0f * zoom, 0, line_thickness);
        break;
    case scene_graph::Node::Shape::Ellipse: {
        ImVec2 center = world_to_screen(cx, cy, offset_x, offset_y, zoom);
        float radius = (float)std::min(w, h) * 0.5f * zoom;
        draw_list->AddCircleFilled(center, radius, to_im_color(node.color()));
        draw_list->AddCircle(center, radius, border_color(node.color()), 0, line_thickness);
        break;
    }
    case scene_graph::Node::Shape::None:
        break;
    }

    if (!node.label().empty()) {
        ImVec2 text_size = ImGui::CalcTextSize(node.label().c_str());
        float tx = min_pt.x + (max_pt.x - min_pt.x - text_size.x) * 0.5f;
        float ty = min_pt.y + (max_pt.y - min_pt.y - text_size.y) * 0.5f;
        draw_list->AddText(ImVec2(tx, ty), text_color, node.label().c_str());
    }

    for (const auto& child : node.children())
        draw_node(draw_list, *child, cx, cy, offset_x, offset_y, zoom);
}

void outline_hit_regions(ImDrawList* draw_list, const scene_graph::Node& node,
    double parent_x, double parent_y, float offset_x, float offset_y, float zoom)
{
    const double cx = parent_x + node.position().x;
    const double cy = parent_y + node.position().y;
    if (node.user_interaction_enabled()) {
        const double w = node.size().width;
        const double h = node.size().height;
        draw_list->AddRect(
            world_to_screen(cx - w * 0.5, cy - h * 0.5, offset_x, offset_y, zoom),
            world_to_screen(cx + w * 0.5, cy + h * 0.5, offset_x, offset_y, zoom),
            IM_COL32(255, 200, 0, 180), 0.0f, 0, 1.0f);
    }
    for (const auto& child : node.children())
        outline_hit_regions(draw_list, *child, cx, cy, offset_x, offset_y, zoom);
}

} // namespace

void render_scene(ImDrawList* draw_list, const scene_graph::Node& root,
    float offset_x, float offset_y, float zoom)
{
    if (!draw_list) return;
    draw_node(draw_list, root, 0.0, 0.0, offset_x, offset_y, zoom);
}

void render_hit_regions(ImDrawList* draw_list, const scene_graph::Node& root,
    float offset_x, float offset_y, float zoom)
{
    if (!draw_list) return;
    outline_hit_regions(draw_list, root, 0.0, 0.0, offset_x, offset_y, zoom);
}

} // namespace scene_render
