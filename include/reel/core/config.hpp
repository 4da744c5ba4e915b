// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace reel::core {

constexpr std::uint32_t DEFAULT_CONCURRENCY_CAP = 3;
constexpr std::uint32_t PROGRESS_REPORT_COUNT = 20;             // Read iterations per progress callback
constexpr std::size_t READ_BUFFER_SIZE = 10 * 1024;             // 10 KB

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 15;
constexpr std::uint32_t READ_TIMEOUT_SEC = 10;                  // No bytes for this long = stalled
constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

constexpr std::int64_t UNKNOWN_SIZE = -1;

constexpr std::chrono::seconds CATALOG_SAVE_INTERVAL{5};

constexpr std::string_view DEFAULT_CATALOG_PATH = "reel-catalog.json";
constexpr std::string_view DEFAULT_USER_AGENT = "reel/0.1";

// Engine configuration
struct EngineConfig {
    std::uint32_t concurrency_cap{DEFAULT_CONCURRENCY_CAP};
    std::uint32_t per_item_cap{0};                // 0 = only the global cap applies
    std::uint32_t progress_report_count{PROGRESS_REPORT_COUNT};
    std::size_t buffer_size{READ_BUFFER_SIZE};
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t read_timeout_sec{READ_TIMEOUT_SEC};
    std::uint32_t max_redirects{MAX_REDIRECTS};
    std::string catalog_path{DEFAULT_CATALOG_PATH};
    std::string user_agent{DEFAULT_USER_AGENT};

    // Load from a JSON file. Keys that are absent keep their defaults.
    [[nodiscard]] static std::expected<EngineConfig, std::error_code>
    load(std::string_view path) noexcept;

    // Parse from a JSON document
    [[nodiscard]] static std::expected<EngineConfig, std::error_code>
    parse(std::string_view json) noexcept;

    [[nodiscard]] std::error_code validate() const noexcept;
};

} // namespace reel::core
