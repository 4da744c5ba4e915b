// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/config.hpp>
#include <reel/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace reel::core {

namespace {

template<typename T>
void read_key(const nlohmann::json& j, const char* key, T& out) {
    if (j.contains(key)) {
        out = j.at(key).get<T>();
    }
}

} // namespace

std::expected<EngineConfig, std::error_code>
EngineConfig::parse(std::string_view json) noexcept {
    EngineConfig cfg;
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(TransferErrc::invalid_config));
        }

        read_key(j, "concurrency_cap", cfg.concurrency_cap);
        read_key(j, "per_item_cap", cfg.per_item_cap);
        read_key(j, "progress_report_count", cfg.progress_report_count);
        read_key(j, "buffer_size", cfg.buffer_size);
        read_key(j, "connect_timeout_sec", cfg.connect_timeout_sec);
        read_key(j, "read_timeout_sec", cfg.read_timeout_sec);
        read_key(j, "max_redirects", cfg.max_redirects);
        read_key(j, "catalog_path", cfg.catalog_path);
        read_key(j, "user_agent", cfg.user_agent);
    } catch (const std::exception& e) {
        spdlog::error("Invalid engine config: {}", e.what());
        return std::unexpected(make_error_code(TransferErrc::invalid_config));
    }

    if (auto ec = cfg.validate()) {
        return std::unexpected(ec);
    }
    return cfg;
}

std::expected<EngineConfig, std::error_code>
EngineConfig::load(std::string_view path) noexcept {
    try {
        std::ifstream file{std::string(path), std::ios::binary};
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        return parse(ss.str());
    } catch (const std::exception& e) {
        spdlog::error("Cannot read engine config {}: {}", path, e.what());
        return std::unexpected(make_error_code(TransferErrc::invalid_config));
    }
}

std::error_code EngineConfig::validate() const noexcept {
    if (concurrency_cap == 0 || progress_report_count == 0 || buffer_size == 0) {
        return make_error_code(TransferErrc::invalid_config);
    }
    if (catalog_path.empty()) {
        return make_error_code(TransferErrc::invalid_config);
    }
    return {};
}

} // namespace reel::core
