// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>

namespace reel::cli {

namespace {

constexpr int BAR_WIDTH = 30;

const char* const FRAMES[] = {"-", "\\", "|", "/"};

std::string fixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

} // namespace

//=============================================================================
// Spinner
//=============================================================================

void Spinner::update(std::string_view status) noexcept {
    const char* frame = FRAMES[frame_ % std::size(FRAMES)];
    std::cout << "\r" << frame << " " << status << "    " << std::flush;
    ++frame_;
}

void Spinner::finish() noexcept {
    std::cout << "\r done" << std::string(40, ' ') << std::endl;
}

void Spinner::clear() noexcept {
    std::cout << "\r" << std::string(60, ' ') << "\r" << std::flush;
}

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::uint64_t total, std::string_view label)
    : total_(total)
    , label_(label) {}

void ProgressBar::update(std::uint64_t current) noexcept {
    if (total_ == 0 || finished_) return;

    current_ = std::min(current, total_);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_).count();
    if (elapsed > 0) {
        speed_bps_ = current_ * 1000 / static_cast<std::uint64_t>(elapsed);
    }

    // Redraw once per percent
    const int percent = static_cast<int>(static_cast<double>(current_) * 100.0 / static_cast<double>(total_));
    if (percent <= last_percent_) return;
    last_percent_ = percent;

    std::cout << render_line(current_) << std::flush;
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    finished_ = true;
    if (total_ > 0) {
        std::cout << render_line(total_);
    }
    std::cout << std::endl;
}

void ProgressBar::clear() noexcept {
    std::cout << "\r" << std::string(80, ' ') << "\r" << std::flush;
}

std::string ProgressBar::render_line(std::uint64_t current) const {
    double percent = static_cast<double>(current) * 100.0 / static_cast<double>(total_);
    percent = std::clamp(percent, 0.0, 100.0);

    std::string line = "\r";
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }
    line += render_bar(percent);

    const int pct = static_cast<int>(percent);
    line += pct < 10 ? "   " : (pct < 100 ? "  " : " ");
    line += std::to_string(pct) + "%";

    line += " (" + format_bytes(current) + "/" + format_bytes(total_) + ")";

    if (speed_bps_ > 0) {
        line += " @ " + format_speed(speed_bps_);
        const std::uint64_t remaining = total_ - current;
        if (remaining > 0) {
            line += " ETA: " + format_time(remaining / speed_bps_);
        }
    }

    line += std::string(10, ' ');
    return line;
}

std::string ProgressBar::render_bar(double percent) const {
    const int filled = static_cast<int>(std::round(BAR_WIDTH * percent / 100.0));
    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (filled < BAR_WIDTH) {
        bar += '>';
        bar.append(static_cast<std::size_t>(BAR_WIDTH - filled - 1), ' ');
    }
    bar += "]";
    return bar;
}

std::string ProgressBar::format_speed(std::uint64_t bps) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;

    if (bps >= GB) return fixed(static_cast<double>(bps) / GB, 1) + " GB/s";
    if (bps >= MB) return fixed(static_cast<double>(bps) / MB, 1) + " MB/s";
    if (bps >= KB) return fixed(static_cast<double>(bps) / KB, 1) + " KB/s";
    return std::to_string(bps) + " B/s";
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    if (bytes >= TB) return fixed(static_cast<double>(bytes) / TB, 2) + " TB";
    if (bytes >= GB) return fixed(static_cast<double>(bytes) / GB, 2) + " GB";
    if (bytes >= MB) return fixed(static_cast<double>(bytes) / MB, 1) + " MB";
    if (bytes >= KB) return fixed(static_cast<double>(bytes) / KB, 0) + " KB";
    return std::to_string(bytes) + " B";
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    const std::uint64_t hours = seconds / 3600;
    const std::uint64_t minutes = (seconds % 3600) / 60;
    const std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        std::ostringstream ss;
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes << "m";
        return ss.str();
    }
    if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

} // namespace reel::cli
