// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <string_view>

namespace reel::core {

constexpr std::string_view LOGGER_NAME = "reel";

// Install the "reel" stderr logger as the spdlog default (idempotent)
void init_logging(spdlog::level::level_enum level = spdlog::level::info) noexcept;

// Parse "trace", "debug", "info", "warn", "error", "off"
[[nodiscard]] spdlog::level::level_enum parse_log_level(std::string_view name) noexcept;

} // namespace reel::core
