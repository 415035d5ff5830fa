#include <button_loaders/json_loader.hpp>
#include <scene_graph/log.hpp>
#include <nlohmann/json.hpp>
#include <charconv>
#include <system_error>
#include <cstdint>
#include <fstream>

namespace button_loaders {

namespace {

std::shared_ptr<spdlog::logger> loader_logger() {
    return scene_graph::logger("button_loaders");
}

scene_graph::Node::Shape shape_from_string(const std::string& s) {
    if (s == "ellipse") return scene_graph::Node::Shape::Ellipse;
    if (s == "none") return scene_graph::Node::Shape::None;
    return scene_graph::Node::Shape::Rectangle;
}

bool parse_byte(const std::string& text, std::size_t pos, std::uint8_t& out) {
    unsigned int value = 0;
    const char* first = text.data() + pos;
    const char* last = first + 2;
    auto [ptr, ec] = std::from_chars(first, last, value, 16);
    if (ec != std::errc() || ptr != last) return false;
    out = static_cast<std::uint8_t>(value);
    return true;
}

std::optional<VisualDesc> parse_visual(const nlohmann::json& v, const std::string& where) {
    if (!v.is_object()) {
        loader_logger()->error("{}: appearance must be an object", where);
        return std::nullopt;
    }
    VisualDesc out;
    if (v.contains("shape") && v["shape"].is_string())
        out.shape = shape_from_string(v["shape"].get<std::string>());
    if (v.contains("color")) {
        std::optional<scene_graph::Color> color;
        if (v["color"].is_string()) color = parse_color(v["color"].get<std::string>());
        if (!color) {
            loader_logger()->error("{}: invalid color {}", where, v["color"].dump());
            return std::nullopt;
        }
        out.color = *color;
    }
    out.label = v.contains("label") && v["label"].is_string() ? v["label"].get<std::string>() : "";
    if (v.contains("width") && v["width"].is_number()) out.width = v["width"].get<double>();
    if (v.contains("height") && v["height"].is_number()) out.height = v["height"].get<double>();
    return out;
}

bool parse_appearance(const nlohmann::json& appearances, const char* key, const std::string& button_id,
    std::optional<VisualDesc>& out)
{
    if (!appearances.contains(key)) return true;
    out = parse_visual(appearances[key], "button '" + button_id + "' appearance '" + key + "'");
    return out.has_value();
}

std::optional<ButtonDesc> parse_button(const nlohmann::json& b) {
    ButtonDesc out;
    if (!b.is_object() || !b.contains("id") || !b["id"].is_string()) {
        loader_logger()->error("button entry without a string id");
        return std::nullopt;
    }
    out.id = b["id"].get<std::string>();
    out.x = b.contains("x") && b["x"].is_number() ? b["x"].get<double>() : 0;
    out.y = b.contains("y") && b["y"].is_number() ? b["y"].get<double>() : 0;
    out.width = b.contains("width") && b["width"].is_number() ? b["width"].get<double>() : 100;
    out.height = b.contains("height") && b["height"].is_number() ? b["height"].get<double>() : 40;
    out.enabled = b.contains("enabled") && b["enabled"].is_boolean() ? b["enabled"].get<bool>() : true;
    out.selected = b.contains("selected") && b["selected"].is_boolean() ? b["selected"].get<bool>() : false;
    out.auto_toggle_selection = b.contains("auto_toggle_selection") && b["auto_toggle_selection"].is_boolean()
        ? b["auto_toggle_selection"].get<bool>() : false;

    if (b.contains("appearances")) {
        const auto& a = b["appearances"];
        if (!a.is_object()) {
            loader_logger()->error("button '{}': appearances must be an object", out.id);
            return std::nullopt;
        }
        if (!parse_appearance(a, "normal", out.id, out.normal)) return std::nullopt;
        if (!parse_appearance(a, "highlighted", out.id, out.highlighted)) return std::nullopt;
        if (!parse_appearance(a, "disabled", out.id, out.disabled)) return std::nullopt;
        if (!parse_appearance(a, "selected_normal", out.id, out.selected_normal)) return std::nullopt;
        if (!parse_appearance(a, "selected_highlighted", out.id, out.selected_highlighted)) return std::nullopt;
    }
    return out;
}

std::optional<SceneDesc> parse_scene_json(const nlohmann::json& j) {
    SceneDesc out;
    if (!j.is_object() || !j.contains("buttons") || !j["buttons"].is_array()) {
        loader_logger()->error("scene has no 'buttons' array");
        return std::nullopt;
    }

    for (const auto& b : j["buttons"]) {
        auto button = parse_button(b);
        if (!button) return std::nullopt;
        out.buttons.push_back(std::move(*button));
    }

    if (j.contains("name") && j["name"].is_string()) out.name = j["name"].get<std::string>();
    if (j.contains("log_level") && j["log_level"].is_string()) {
        out.log_level = j["log_level"].get<std::string>();
        if (!scene_graph::parse_log_level(out.log_level)) {
            loader_logger()->error("unknown log_level '{}'", out.log_level);
            return std::nullopt;
        }
    }
    return out;
}

} // namespace

std::optional<scene_graph::Color> parse_color(const std::string& text) {
    if (text.size() != 7 && text.size() != 9) return std::nullopt;
    if (text[0] != '#') return std::nullopt;

    scene_graph::Color c;
    if (!parse_byte(text, 1, c.r) || !parse_byte(text, 3, c.g) || !parse_byte(text, 5, c.b))
        return std::nullopt;
    if (text.size() == 9 && !parse_byte(text, 7, c.a)) return std::nullopt;
    return c;
}

std::optional<SceneDesc> load_scene_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_scene_json(j);
    } catch (const nlohmann::json::exception& e) {
        loader_logger()->error("scene json rejected: {}", e.what());
        return std::nullopt;
    }
}

std::optional<SceneDesc> load_scene_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    auto scene = load_scene_from_json(f);
    if (scene) loader_logger()->info("loaded scene '{}' from {} ({} buttons)", scene->name, path, scene->buttons.size());
    return scene;
}

} // namespace button_loaders
