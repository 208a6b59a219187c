#pragma once

#include <spdlog/logger.h>

#include <memory>
#include <optional>
#include <string_view>

namespace restcore::logging {

using LoggerPtr = std::shared_ptr<spdlog::logger>;

// Discards everything. Default for components that are not given a logger.
LoggerPtr null_logger();

// Colour stdout logger named "restcore". Not registered globally.
LoggerPtr make_console_logger(spdlog::level::level_enum level);

// "trace", "debug", "info", "warn", "error", "critical" or "off".
std::optional<spdlog::level::level_enum> parse_level(std::string_view name);

} // namespace restcore::logging
