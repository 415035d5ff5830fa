#include <canvas/canvas.hpp>
#include <scene_render/renderer.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include "imgui.h"
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <utility>

namespace {

std::filesystem::path find_project_root() {
    std::filesystem::path p = std::filesystem::current_path();
    for (int i = 0; i < 8; ++i) {
        if (std::filesystem::exists(p / "CMakeLists.txt") && std::filesystem::exists(p / "src")) {
            return p;
        }
        if (!p.has_parent_path()) break;
        p = p.parent_path();
    }
    return std::filesystem::current_path();
}

std::shared_ptr<spdlog::logger> touch_logger() {
    static std::shared_ptr<spdlog::logger> logger;
    if (logger) return logger;

    try {
        const std::filesystem::path logs_dir = find_project_root() / "logs";
        std::filesystem::create_directories(logs_dir);
        const std::filesystem::path log_file = logs_dir / "touch_events_latest.log";
        logger = spdlog::basic_logger_mt("touch_event_logger", log_file.string(), true);
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger->info("Touch logger initialized. file={}", log_file.string());
    } catch (const spdlog::spdlog_ex&) {
        logger = spdlog::default_logger();
    } catch (const std::filesystem::filesystem_error&) {
        logger = spdlog::default_logger();
    }
    return logger;
}

} // namespace

namespace canvas {

SceneCanvas::SceneCanvas() = default;

SceneCanvas::~SceneCanvas() = default;

void SceneCanvas::set_scene(std::shared_ptr<scene_graph::Node> root) {
    touch_ids_.clear();
    dispatcher_.set_root(std::move(root));
}

void SceneCanvas::pan(float dx, float dy) {
    offset_x_ += dx;
    offset_y_ += dy;
}

void SceneCanvas::zoom_at(float screen_x, float screen_y, float zoom_delta) {
    float new_zoom = zoom_ * zoom_delta;
    if (new_zoom < 0.1f) new_zoom = 0.1f;
    if (new_zoom > 10.0f) new_zoom = 10.0f;
    float factor = new_zoom / zoom_;
    offset_x_ = screen_x - (screen_x - offset_x_) * factor;
    offset_y_ = screen_y - (screen_y - offset_y_) * factor;
    zoom_ = new_zoom;
}

void SceneCanvas::screen_to_world(float screen_x, float screen_y, double& world_x, double& world_y) const {
    world_x = (screen_x - offset_x_) / zoom_;
    world_y = (screen_y - offset_y_) / zoom_;
}

void SceneCanvas::world_to_screen(double world_x, double world_y, float& screen_x, float& screen_y) const {
    screen_x = (float)world_x * zoom_ + offset_x_;
    screen_y = (float)world_y * zoom_ + offset_y_;
}

void SceneCanvas::set_view_center(float screen_center_x, float screen_center_y) {
    offset_x_ = screen_center_x;
    offset_y_ = screen_center_y;
    view_centered_ = true;
}

scene_graph::Touch SceneCanvas::make_touch(scene_graph::TouchId id, float screen_x, float screen_y) const {
    scene_graph::Touch t;
    t.id = id;
    screen_to_world(screen_x, screen_y, t.location.x, t.location.y);
    t.previous_location = t.location;
    return t;
}

void SceneCanvas::handle_finger(FingerPhase phase, std::uint64_t finger_id, float screen_x, float screen_y) {
    using scene_graph::TouchSource;
    switch (phase) {
    case FingerPhase::Down: {
        if (touch_ids_.find(TouchSource::Finger, finger_id)) break;
        const scene_graph::Touch t = make_touch(touch_ids_.acquire(TouchSource::Finger, finger_id), screen_x, screen_y);
        if (dispatcher_.touch_began(t))
            touch_logger()->info("finger_down finger={} id={} at ({}, {})", finger_id, t.id, t.location.x, t.location.y);
        else
            touch_ids_.release(TouchSource::Finger, finger_id);
        break;
    }
    case FingerPhase::Motion:
        if (auto id = touch_ids_.find(TouchSource::Finger, finger_id))
            dispatcher_.touch_moved(make_touch(*id, screen_x, screen_y));
        break;
    case FingerPhase::Up:
        if (auto id = touch_ids_.release(TouchSource::Finger, finger_id)) {
            const scene_graph::Touch t = make_touch(*id, screen_x, screen_y);
            touch_logger()->info("finger_up finger={} id={} at ({}, {})", finger_id, t.id, t.location.x, t.location.y);
            dispatcher_.touch_ended(t);
        }
        break;
    case FingerPhase::Cancelled:
        if (auto id = touch_ids_.release(TouchSource::Finger, finger_id))
            dispatcher_.touch_cancelled(make_touch(*id, screen_x, screen_y));
        break;
    }
}

bool SceneCanvas::inject_touch_began(std::uint64_t script_id, scene_graph::Point scene_point) {
    using scene_graph::TouchSource;
    if (touch_ids_.find(TouchSource::Scripted, script_id)) return false;
    const scene_graph::TouchId id = touch_ids_.acquire(TouchSource::Scripted, script_id);
    if (dispatcher_.touch_began(scene_graph::Touch{ id, scene_point, scene_point })) return true;
    touch_ids_.release(TouchSource::Scripted, script_id);
    return false;
}

void SceneCanvas::inject_touch_moved(std::uint64_t script_id, scene_graph::Point scene_point) {
    if (auto id = touch_ids_.find(scene_graph::TouchSource::Scripted, script_id))
        dispatcher_.touch_moved(scene_graph::Touch{ *id, scene_point, scene_point });
}

void SceneCanvas::inject_touch_ended(std::uint64_t script_id, scene_graph::Point scene_point) {
    if (auto id = touch_ids_.release(scene_graph::TouchSource::Scripted, script_id))
        dispatcher_.touch_ended(scene_graph::Touch{ *id, scene_point, scene_point });
}

void SceneCanvas::cancel_touches() {
    if (dispatcher_.active_touch_count() > 0)
        touch_logger()->info("cancel_all active={}", dispatcher_.active_touch_count());
    touch_ids_.clear();
    dispatcher_.cancel_all();
}

void SceneCanvas::draw_grid(ImVec2 region_min, ImVec2 region_max) {
    ImDrawList* dl = ImGui::GetWindowDrawList();
    if (!dl) return;

    const unsigned int grid_color = IM_COL32(60, 60, 65, 255);
    const unsigned int axis_color = IM_COL32(90, 90, 100, 255);
    const float grid_thickness = 1.0f;

    double left_world, top_world, right_world, bottom_world;
    screen_to_world(region_min.x, region_min.y, left_world, top_world);
    screen_to_world(region_max.x, region_max.y, right_world, bottom_world);

    double start_x = std::floor(left_world / grid_step_) * grid_step_;
    double start_y = std::floor(top_world / grid_step_) * grid_step_;

    for (double wx = start_x; wx <= right_world + grid_step_; wx += grid_step_) {
        float sx1, sy1, sx2, sy2;
        world_to_screen(wx, top_world, sx1, sy1);
        world_to_screen(wx, bottom_world, sx2, sy2);
        dl->AddLine(ImVec2(sx1, sy1), ImVec2(sx2, sy2), std::abs(wx) < 1e-9 ? axis_color : grid_color, grid_thickness);
    }
    for (double wy = start_y; wy <= bottom_world + grid_step_; wy += grid_step_) {
        float sx1, sy1, sx2, sy2;
        world_to_screen(left_world, wy, sx1, sy1);
        world_to_screen(right_world, wy, sx2, sy2);
        dl->AddLine(ImVec2(sx1, sy1), ImVec2(sx2, sy2), std::abs(wy) < 1e-9 ? axis_color : grid_color, grid_thickness);
    }
}

void SceneCanvas::handle_input(ImVec2 region_min, float region_width, float region_height) {
    ImGuiIO& io = ImGui::GetIO();
    ImVec2 mouse = io.MousePos;
    ImVec2 region_max = ImVec2(region_min.x + region_width, region_min.y + region_height);

    bool in_region = mouse.x >= region_min.x && mouse.x <= region_max.x &&
                     mouse.y >= region_min.y && mouse.y <= region_max.y;

    using scene_graph::TouchSource;
    constexpr std::uint64_t left_button = 0;

    if (ImGui::IsMouseClicked(0) && in_region && !touch_ids_.find(TouchSource::Mouse, left_button)) {
        const scene_graph::Touch t = make_touch(touch_ids_.acquire(TouchSource::Mouse, left_button), mouse.x, mouse.y);
        if (dispatcher_.touch_began(t))
            touch_logger()->info("mouse_down id={} at ({}, {})", t.id, t.location.x, t.location.y);
        else
            touch_ids_.release(TouchSource::Mouse, left_button);
    }

    if (auto id = touch_ids_.find(TouchSource::Mouse, left_button)) {
        const scene_graph::Touch t = make_touch(*id, mouse.x, mouse.y);
        if (ImGui::IsMouseReleased(0)) {
            touch_logger()->info("mouse_up id={} at ({}, {})", t.id, t.location.x, t.location.y);
            touch_ids_.release(TouchSource::Mouse, left_button);
            dispatcher_.touch_ended(t);
        } else if (io.MouseDelta.x != 0.0f || io.MouseDelta.y != 0.0f) {
            dispatcher_.touch_moved(t);
        }
        // The target may have dropped the touch through cancel_all.
        if (!dispatcher_.is_tracking(*id)) touch_ids_.release(TouchSource::Mouse, left_button);
    }

    if ((ImGui::IsMouseClicked(1) || ImGui::IsMouseClicked(2)) && in_region) {
        panning_ = true;
        pan_start_x_ = mouse.x;
        pan_start_y_ = mouse.y;
        pan_start_offset_x_ = offset_x_;
        pan_start_offset_y_ = offset_y_;
    }
    if (panning_ && !ImGui::IsMouseDown(1) && !ImGui::IsMouseDown(2))
        panning_ = false;
    if (panning_) {
        offset_x_ = pan_start_offset_x_ + (mouse.x - pan_start_x_);
        offset_y_ = pan_start_offset_y_ + (mouse.y - pan_start_y_);
    }

    if (in_region && io.MouseWheel != 0.0f) {
        float factor = io.MouseWheel > 0 ? 1.2f : 1.0f / 1.2f;
        zoom_at(mouse.x, mouse.y, factor);
    }
}

bool SceneCanvas::update_and_draw(float region_width, float region_height) {
    if (region_width <= 0 || region_height <= 0) return false;

    ImVec2 region_min = ImGui::GetCursorScreenPos();
    ImVec2 region_max = ImVec2(region_min.x + region_width, region_min.y + region_height);
    if (!view_centered_)
        set_view_center(region_min.x + region_width * 0.5f, region_min.y + region_height * 0.5f);

    handle_input(region_min, region_width, region_height);

    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    if (!draw_list) return true;

    draw_grid(region_min, region_max);

    if (const auto& root = dispatcher_.root()) {
        scene_render::render_scene(draw_list, *root, offset_x_, offset_y_, zoom_);
        if (show_hit_regions_)
            scene_render::render_hit_regions(draw_list, *root, offset_x_, offset_y_, zoom_);
    }
    return true;
}

} // namespace canvas
