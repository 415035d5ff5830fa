#pragma once

#include <scene_graph/node.hpp>
#include <scene_graph/touch.hpp>
#include <scene_graph/touch_dispatcher.hpp>
#include <scene_graph/touch_id_map.hpp>
#include <cstdint>
#include <memory>

struct ImVec2;

namespace canvas {

// Interactive view of a scene: owns the touch dispatch pass for it and
// translates screen input into touches in scene space.
class SceneCanvas {
public:
    enum class FingerPhase { Down, Motion, Up, Cancelled };

    SceneCanvas();
    ~SceneCanvas();

    void set_scene(std::shared_ptr<scene_graph::Node> root);
    const std::shared_ptr<scene_graph::Node>& scene() const { return dispatcher_.root(); }
    scene_graph::TouchDispatcher& dispatcher() { return dispatcher_; }

    void set_grid_step(float step) { grid_step_ = step; }
    float grid_step() const { return grid_step_; }
    void set_show_hit_regions(bool show) { show_hit_regions_ = show; }
    bool show_hit_regions() const { return show_hit_regions_; }

    void pan(float dx, float dy);
    void zoom_at(float screen_x, float screen_y, float zoom_delta);

    void screen_to_world(float screen_x, float screen_y, double& world_x, double& world_y) const;
    void world_to_screen(double world_x, double world_y, float& screen_x, float& screen_y) const;

    void set_view_center(float screen_center_x, float screen_center_y);
    float offset_x() const { return offset_x_; }
    float offset_y() const { return offset_y_; }
    float zoom() const { return zoom_; }

    // Screen coordinates in pixels. Finger, mouse and injected touches get
    // dispatcher ids from one TouchIdMap, so their raw ids never collide.
    void handle_finger(FingerPhase phase, std::uint64_t finger_id, float screen_x, float screen_y);

    // Scripted touch input in scene space, bypassing the view transform.
    bool inject_touch_began(std::uint64_t script_id, scene_graph::Point scene_point);
    void inject_touch_moved(std::uint64_t script_id, scene_graph::Point scene_point);
    void inject_touch_ended(std::uint64_t script_id, scene_graph::Point scene_point);

    // System interruption, e.g. the window lost focus.
    void cancel_touches();

    bool update_and_draw(float region_width, float region_height);

private:
    scene_graph::TouchDispatcher dispatcher_;
    scene_graph::TouchIdMap touch_ids_;
    float offset_x_ = 0;
    float offset_y_ = 0;
    float zoom_ = 1.0f;
    float grid_step_ = 40.0f;
    bool view_centered_ = false;
    bool show_hit_regions_ = false;
    bool panning_ = false;
    float pan_start_x_ = 0;
    float pan_start_y_ = 0;
    float pan_start_offset_x_ = 0;
    float pan_start_offset_y_ = 0;

    void draw_grid(ImVec2 region_min, ImVec2 region_max);
    void handle_input(ImVec2 region_min, float region_width, float region_height);
    scene_graph::Touch make_touch(scene_graph::TouchId id, float screen_x, float screen_y) const;
};

} // namespace canvas
