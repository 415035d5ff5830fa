#include <scene_graph/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace scene_graph {

std::shared_ptr<spdlog::logger> logger(const std::string& name) {
    if (auto existing = spdlog::get(name)) return existing;

    try {
        auto created = spdlog::stderr_color_mt(name);
        created->set_pattern("[%H:%M:%S.%e] [%n] [%l] %v");
        return created;
    } catch (const spdlog::spdlog_ex&) {
        if (auto existing = spdlog::get(name)) return existing;
        return spdlog::default_logger();
    }
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& text) {
    const spdlog::level::level_enum level = spdlog::level::from_str(text);
    // from_str maps unknown names to off.
    if (level == spdlog::level::off && text != "off") return std::nullopt;
    return level;
}

} // namespace scene_graph
