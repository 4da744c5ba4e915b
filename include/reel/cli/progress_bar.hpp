// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace reel::cli {

// Single-line progress bar for item downloads
class ProgressBar {
public:
    explicit ProgressBar(std::uint64_t total = 0, std::string_view label = {});

    // Redraw with the current byte count. Speed is derived from successive calls.
    void update(std::uint64_t current) noexcept;

    // Draw the final state and end the line
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }
    void total(std::uint64_t t) noexcept { total_ = t; }

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) noexcept { label_ = l; }

    [[nodiscard]] static std::string format_speed(std::uint64_t bps);
    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);
    [[nodiscard]] static std::string format_time(std::uint64_t seconds);

private:
    [[nodiscard]] std::string render_bar(double percent) const;
    [[nodiscard]] std::string render_line(std::uint64_t current) const;

    std::uint64_t total_{0};
    std::uint64_t current_{0};
    std::uint64_t speed_bps_{0};
    int last_percent_{-1};
    std::string label_;
    bool finished_{false};
    std::chrono::steady_clock::time_point start_{std::chrono::steady_clock::now()};
};

// Spinner for transfers of unknown size
class Spinner {
public:
    void update(std::string_view status = {}) noexcept;
    void finish() noexcept;
    void clear() noexcept;

private:
    std::size_t frame_{0};
};

} // namespace reel::cli
