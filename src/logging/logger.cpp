#include "restcore/logging/logger.h"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>

namespace restcore::logging {

LoggerPtr null_logger() {
    static const LoggerPtr logger = std::make_shared<spdlog::logger>(
        "restcore-null", std::make_shared<spdlog::sinks::null_sink_mt>());
    return logger;
}

LoggerPtr make_console_logger(spdlog::level::level_enum level) {
    auto logger = std::make_shared<spdlog::logger>(
        "restcore", std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    logger->set_level(level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->flush_on(spdlog::level::err);
    return logger;
}

std::optional<spdlog::level::level_enum> parse_level(std::string_view name) {
    const std::string value(name);
    const auto level = spdlog::level::from_str(value);
    // from_str() maps unknown names to off.
    if (level == spdlog::level::off && value != "off") {
        return std::nullopt;
    }
    return level;
}

} // namespace restcore::logging
