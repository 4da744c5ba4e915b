// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>

namespace reel::core {

void init_logging(spdlog::level::level_enum level) noexcept {
    try {
        auto logger = spdlog::get(std::string(LOGGER_NAME));
        if (!logger) {
            logger = spdlog::stderr_color_mt(std::string(LOGGER_NAME));
            logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] [t%t] %v");
            spdlog::set_default_logger(logger);
        }
        logger->set_level(level);
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::warn("Logger setup failed: {}", e.what());
    }
}

spdlog::level::level_enum parse_log_level(std::string_view name) noexcept {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off") return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace reel::core
