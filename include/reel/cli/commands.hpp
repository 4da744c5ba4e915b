// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/core/coordinator.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace reel::cli {

// Process exit code, or the error that ended the command
using CliResult = std::expected<int, std::error_code>;

constexpr int EXIT_INTERRUPTED = 130;

// Command line arguments
struct CliArgs {
    std::vector<std::string> urls;
    std::string item_id;
    std::string output_dir;
    std::string catalog_path;
    std::string config_path;
    std::uint32_t concurrency{0};   // 0 = keep the configured cap
    bool info{false};
    bool resume{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::vector<std::string> errors;  // Unknown options, missing values
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Configuration from --config (or defaults) with command line overrides applied
[[nodiscard]] std::expected<core::EngineConfig, std::error_code> load_config(const CliArgs& args) noexcept;

// One resource per URL, saved under dir by the URL's file name. URLs that
// share a file name get their position in the list as a prefix ("2-01.ts").
[[nodiscard]] std::expected<std::vector<core::ResourceSpec>, std::error_code>
plan_resources(const std::vector<std::string>& urls, const std::filesystem::path& dir) noexcept;

// Download every URL of args as one item
[[nodiscard]] CliResult download(const CliArgs& args, const core::EngineConfig& config) noexcept;

// Finish every item the catalog still has pending work for
[[nodiscard]] CliResult resume(const CliArgs& args, const core::EngineConfig& config) noexcept;

// Show resource info without downloading
[[nodiscard]] CliResult info(const std::string& url, const core::EngineConfig& config) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace reel::cli
