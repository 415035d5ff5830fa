#include <button_loaders/demo_scene.hpp>

namespace button_loaders {

SceneDesc generate_demo_scene() {
    SceneDesc out;
    out.name = "Button demo (built-in)";
    out.log_level = "info";

    auto rgb = [](int r, int g, int b) {
        return scene_graph::Color{ static_cast<std::uint8_t>(r), static_cast<std::uint8_t>(g),
                                   static_cast<std::uint8_t>(b), 255 };
    };
    auto look = [](scene_graph::Color color, const char* label,
                   scene_graph::Node::Shape shape = scene_graph::Node::Shape::Rectangle) {
        VisualDesc v;
        v.shape = shape;
        v.color = color;
        v.label = label;
        return v;
    };
    auto add_button = [&](const char* id, double x, double y, double w, double h) -> ButtonDesc& {
        ButtonDesc b;
        b.id = id;
        b.x = x;
        b.y = y;
        b.width = w;
        b.height = h;
        out.buttons.push_back(std::move(b));
        return out.buttons.back();
    };

    {
        auto& b = add_button("play", 0, -120, 220, 56);
        b.normal = look(rgb(58, 110, 165), "Play");
        b.highlighted = look(rgb(96, 150, 210), "Play");
        b.disabled = look(rgb(70, 70, 74), "Locked");
    }
    {
        auto& b = add_button("sound", 0, -40, 220, 56);
        b.auto_toggle_selection = true;
        b.normal = look(rgb(90, 60, 60), "Sound: off");
        b.highlighted = look(rgb(130, 90, 90), "Sound: off");
        b.selected_normal = look(rgb(60, 120, 70), "Sound: on");
        b.selected_highlighted = look(rgb(90, 160, 100), "Sound: on");
    }
    {
        auto& b = add_button("lock", 0, 40, 220, 56);
        b.auto_toggle_selection = true;
        b.normal = look(rgb(80, 80, 88), "Lock play");
        b.highlighted = look(rgb(110, 110, 120), "Lock play");
        b.selected_normal = look(rgb(150, 110, 40), "Unlock play");
        b.selected_highlighted = look(rgb(190, 140, 60), "Unlock play");
    }
    {
        auto& b = add_button("shop", 0, 120, 220, 56);
        b.enabled = false;
        b.normal = look(rgb(58, 110, 165), "Shop");
        b.highlighted = look(rgb(96, 150, 210), "Shop");
        b.disabled = look(rgb(70, 70, 74), "Shop (soon)");
    }
    {
        auto& b = add_button("round", 200, 0, 80, 80);
        b.normal = look(rgb(150, 60, 140), "Go", scene_graph::Node::Shape::Ellipse);
        b.highlighted = look(rgb(200, 90, 190), "Go!", scene_graph::Node::Shape::Ellipse);
    }

    return out;
}

} // namespace button_loaders
