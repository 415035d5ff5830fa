#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <string>

namespace scene_graph {

// Returns the named logger from spdlog's registry, creating a stderr color
// logger on first use. Falls back to the default logger if creation fails.
std::shared_ptr<spdlog::logger> logger(const std::string& name);

// Applies to every registered logger and to loggers created afterwards.
void set_log_level(spdlog::level::level_enum level);

// Accepts spdlog level names ("trace", "debug", "info", "warn", "err", "critical", "off").
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& text);

} // namespace scene_graph
