// Button viewer: ImGui + SDL3 + OpenGL3 (C++20)
#define SDL_MAIN_HANDLED

#include "imgui.h"
#include "imgui_impl_sdl3.h"
#include "imgui_impl_opengl3.h"
#include <button_loaders/demo_scene.hpp>
#include <button_loaders/json_loader.hpp>
#include <button_loaders/scene_builder.hpp>
#include <canvas/canvas.hpp>
#include <scene_graph/log.hpp>
#include <touch_button/button.hpp>
#include <SDL3/SDL.h>
#include <SDL3/SDL_main.h>
#include <SDL3/SDL_opengl.h>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

// Receives the demo buttons' target-action callbacks.
class DemoController {
public:
    explicit DemoController(const button_loaders::BuiltScene& scene)
        : play_(scene.button("play"))
    {
    }

    void on_play(touch_button::Button&) {
        ++play_count;
        scene_graph::logger("button_viewer")->info("play tapped ({} so far)", play_count);
    }

    void on_play_down(touch_button::Button&) { ++play_down_count; }
    void on_any_up(touch_button::Button& sender) {
        ++touch_up_count;
        scene_graph::logger("button_viewer")->debug("touch up on '{}'", sender.name());
    }

    void on_sound(touch_button::Button& sender) {
        scene_graph::logger("button_viewer")->info("sound {}", sender.selected() ? "on" : "off");
    }

    void on_lock(touch_button::Button& sender) {
        if (play_) play_->set_enabled(!sender.selected());
    }

    void on_round(touch_button::Button&) { ++round_count; }

    int play_count = 0;
    int play_down_count = 0;
    int touch_up_count = 0;
    int round_count = 0;

private:
    std::shared_ptr<touch_button::Button> play_;
};

void wire_demo_callbacks(const button_loaders::BuiltScene& scene, const std::shared_ptr<DemoController>& controller) {
    if (auto b = scene.button("play")) {
        b->set_touch_down_target(controller, &DemoController::on_play_down);
        b->set_touch_up_inside_target(controller, &DemoController::on_play);
    }
    if (auto b = scene.button("sound"))
        b->set_touch_up_inside_target(controller, &DemoController::on_sound);
    if (auto b = scene.button("lock"))
        b->set_touch_up_inside_target(controller, &DemoController::on_lock);
    if (auto b = scene.button("round"))
        b->set_touch_up_inside_target(controller, &DemoController::on_round);
    for (const auto& [id, b] : scene.buttons)
        b->set_touch_up_target(controller, &DemoController::on_any_up);
}

} // namespace

int main(int argc, char* argv[])
{
    bool auto_touch_test = false;
    std::string scene_path;
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        if (arg == "--auto-touch-test") {
            auto_touch_test = true;
        } else if (scene_path.empty()) {
            scene_path = arg;
        }
    }

    std::optional<button_loaders::SceneDesc> scene_desc;
    std::vector<std::string> scene_paths = { "data/button_scene.json", "button_scene.json" };
    if (!scene_path.empty()) scene_paths.insert(scene_paths.begin(), scene_path);
    // The scripted test relies on the built-in layout.
    if (!auto_touch_test) {
        for (const auto& path : scene_paths) {
            scene_desc = button_loaders::load_scene_from_json_file(path);
            if (scene_desc) break;
        }
    }
    if (!scene_desc)
        scene_desc = button_loaders::generate_demo_scene();

    button_loaders::BuiltScene scene = button_loaders::build_scene(*scene_desc);
    auto controller = std::make_shared<DemoController>(scene);
    wire_demo_callbacks(scene, controller);

    SDL_SetMainReady();
    // Touches are dispatched from finger events; synthesized mouse events would deliver them twice.
    SDL_SetHint(SDL_HINT_TOUCH_MOUSE_EVENTS, "0");
    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        (void)fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);

    int window_width = 1024;
    int window_height = 720;
    const SDL_WindowFlags window_flags = SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE
        | SDL_WINDOW_HIGH_PIXEL_DENSITY;
    SDL_Window* window = SDL_CreateWindow("Buttons", window_width, window_height, window_flags);
    if (!window) {
        (void)fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        (void)fprintf(stderr, "SDL_GL_CreateContext failed: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    ImGui::StyleColorsDark();

    ImGui_ImplSDL3_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 130");

    canvas::SceneCanvas scene_canvas;
    scene_canvas.set_scene(scene.root);

    bool running = true;
    int frame = 0;
    enum class Step { Down, Move, Up };
    struct TouchAction {
        int frame_index;
        Step step;
        scene_graph::Point at;
    };
    // Tap play, drag off play, toggle sound, lock play, tap the locked play, unlock.
    const std::vector<TouchAction> auto_actions = {
        {10, Step::Down, {0, -120}},
        {12, Step::Up, {0, -120}},
        {20, Step::Down, {10, -110}},
        {22, Step::Move, {500, 500}},
        {24, Step::Up, {500, 500}},
        {30, Step::Down, {0, -40}},
        {32, Step::Up, {0, -40}},
        {40, Step::Down, {0, 40}},
        {42, Step::Up, {0, 40}},
        {50, Step::Down, {0, -120}},
        {52, Step::Up, {0, -120}},
        {60, Step::Down, {0, 40}},
        {62, Step::Up, {0, 40}},
        {70, Step::Down, {200, 0}},
        {72, Step::Up, {200, 0}},
    };
    std::size_t next_action = 0;
    int test_exit_code = 0;
    const std::uint64_t scripted_touch = 0;

    while (running) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL3_ProcessEvent(&event);
            if (event.type == SDL_EVENT_QUIT)
                running = false;
            if (event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED &&
                event.window.windowID == SDL_GetWindowID(window))
                running = false;
            if (event.type == SDL_EVENT_WINDOW_FOCUS_LOST)
                scene_canvas.cancel_touches();
            if (event.type == SDL_EVENT_FINGER_DOWN || event.type == SDL_EVENT_FINGER_MOTION ||
                event.type == SDL_EVENT_FINGER_UP || event.type == SDL_EVENT_FINGER_CANCELED)
            {
                const float sx = event.tfinger.x * io.DisplaySize.x;
                const float sy = event.tfinger.y * io.DisplaySize.y;
                canvas::SceneCanvas::FingerPhase phase = canvas::SceneCanvas::FingerPhase::Motion;
                if (event.type == SDL_EVENT_FINGER_DOWN) phase = canvas::SceneCanvas::FingerPhase::Down;
                else if (event.type == SDL_EVENT_FINGER_UP) phase = canvas::SceneCanvas::FingerPhase::Up;
                else if (event.type == SDL_EVENT_FINGER_CANCELED) phase = canvas::SceneCanvas::FingerPhase::Cancelled;
                scene_canvas.handle_finger(phase, static_cast<std::uint64_t>(event.tfinger.fingerID), sx, sy);
            }
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL3_NewFrame();
        ImGui::NewFrame();

        ImGui::SetNextWindowPos(ImVec2(0, 0));
        ImGui::SetNextWindowSize(io.DisplaySize);
        ImGui::Begin("Buttons", nullptr,
            ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove
            | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoBringToFrontOnFocus);
        bool show_hits = scene_canvas.show_hit_regions();
        if (ImGui::Checkbox("Hit regions", &show_hits))
            scene_canvas.set_show_hit_regions(show_hits);
        ImGui::SameLine();
        ImGui::Text("play: %d  touch ups: %d  active touches: %zu",
            controller->play_count, controller->touch_up_count,
            scene_canvas.dispatcher().active_touch_count());
        ImVec2 canvas_size = ImGui::GetContentRegionAvail();
        if (canvas_size.x > 0 && canvas_size.y > 0) {
            ImGui::BeginChild("canvas", canvas_size, false, ImGuiWindowFlags_NoScrollbar);
            scene_canvas.update_and_draw(canvas_size.x, canvas_size.y);
            ImGui::EndChild();
        }
        ImGui::End();

        if (auto_touch_test) {
            while (next_action < auto_actions.size() && frame >= auto_actions[next_action].frame_index) {
                const TouchAction& a = auto_actions[next_action];
                switch (a.step) {
                case Step::Down: scene_canvas.inject_touch_began(scripted_touch, a.at); break;
                case Step::Move: scene_canvas.inject_touch_moved(scripted_touch, a.at); break;
                case Step::Up: scene_canvas.inject_touch_ended(scripted_touch, a.at); break;
                }
                ++next_action;
            }

            if (next_action >= auto_actions.size()) {
                auto play = scene.button("play");
                auto sound = scene.button("sound");
                const bool ok = controller->play_count == 1 && controller->play_down_count == 2
                    && controller->touch_up_count == 6 && controller->round_count == 1
                    && sound && sound->selected() && play && play->enabled();
                (void)fprintf(stderr,
                    "[auto-touch-test] finished frame=%d play=%d play_down=%d touch_up=%d round=%d ok=%d\n",
                    frame, controller->play_count, controller->play_down_count,
                    controller->touch_up_count, controller->round_count, ok ? 1 : 0);
                test_exit_code = ok ? 0 : 2;
                running = false;
            }
        }

        ImGui::Render();
        SDL_GL_MakeCurrent(window, gl_context);
        const int fb_w = (int)(io.DisplaySize.x * io.DisplayFramebufferScale.x);
        const int fb_h = (int)(io.DisplaySize.y * io.DisplayFramebufferScale.y);
        glViewport(0, 0, fb_w, fb_h);
        glClearColor(0.1f, 0.1f, 0.12f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(window);
        ++frame;
    }

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();

    SDL_GL_DestroyContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();
    if (auto_touch_test) {
        return test_exit_code;
    }
    return 0;
}
