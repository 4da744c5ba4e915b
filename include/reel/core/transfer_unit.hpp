// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/core/error.hpp>
#include <reel/core/http_session.hpp>
#include <reel/core/unit_descriptor.hpp>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace reel::core {

// Transfer unit state machine
enum class UnitState : std::uint8_t {
    idle,        // Not started
    in_progress, // Probing or streaming
    completed,   // Local file equals the remote resource
    stopped,     // Cancelled; partial bytes kept for resume
    error        // Unrecoverable failure for this unit
};

[[nodiscard]] std::string_view to_string(UnitState state) noexcept;
[[nodiscard]] std::optional<UnitState> unit_state_from_string(std::string_view name) noexcept;

[[nodiscard]] constexpr bool is_terminal(UnitState state) noexcept {
    return state == UnitState::completed || state == UnitState::stopped || state == UnitState::error;
}

// Receives unit callbacks on the unit's own thread. Implementations must return quickly.
class ProgressReporter {
public:
    virtual ~ProgressReporter() = default;

    // State transition or byte delta. bytes is 0 for pure state transitions.
    virtual void on_progress(const std::string& unit_id, UnitState state, std::uint64_t bytes) noexcept = 0;

    // A stale partial file longer than the remote resource was deleted
    virtual void on_truncated(const std::string& unit_id, std::uint64_t discarded_bytes) noexcept {
        (void)unit_id;
        (void)discarded_bytes;
    }
};

struct TransferOptions {
    std::uint32_t progress_report_count{PROGRESS_REPORT_COUNT};
};

// One resumable download of one resource to one local file
class TransferUnit {
public:
    explicit TransferUnit(UnitDescriptor descriptor) noexcept;

    // Non-copyable, non-movable (atomic members)
    TransferUnit(const TransferUnit&) = delete;
    TransferUnit& operator=(const TransferUnit&) = delete;
    TransferUnit(TransferUnit&&) = delete;
    TransferUnit& operator=(TransferUnit&&) = delete;

    // Run the transfer on the calling thread until a terminal state is reached.
    // Re-running after STOPPED or ERROR resumes from the bytes on disk.
    // A concurrent second call returns immediately without callbacks.
    UnitState run(HttpTransport& transport,
                  ProgressReporter& reporter,
                  std::stop_token stop,
                  const TransferOptions& options = {}) noexcept;

    [[nodiscard]] const UnitDescriptor& descriptor() const noexcept { return descriptor_; }
    [[nodiscard]] const std::string& id() const noexcept { return descriptor_.id; }
    [[nodiscard]] const std::string& url() const noexcept { return descriptor_.url; }
    [[nodiscard]] const std::string& target_path() const noexcept { return descriptor_.target_path; }
    [[nodiscard]] const std::string& item_id() const noexcept { return descriptor_.item_id; }
    [[nodiscard]] const std::string& track_ref() const noexcept { return descriptor_.track_ref; }

    [[nodiscard]] UnitState state() const noexcept { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] bool is_running() const noexcept { return running_.load(std::memory_order_acquire); }

    // Remote size from the last probe, UNKNOWN_SIZE if not known
    [[nodiscard]] std::int64_t remote_size() const noexcept { return remote_size_.load(std::memory_order_relaxed); }

    // Current size of the partial or complete target file
    [[nodiscard]] std::uint64_t local_size() const noexcept;

    [[nodiscard]] std::error_code last_error() const noexcept {
        std::lock_guard<std::mutex> lock(error_mutex_);
        return last_error_;
    }

    friend bool operator==(const TransferUnit& a, const TransferUnit& b) noexcept {
        return a.descriptor_ == b.descriptor_;
    }

private:
    // Set the terminal state and issue its callback
    UnitState settle(ProgressReporter& reporter, UnitState state, std::error_code ec) noexcept;

    UnitDescriptor descriptor_;
    std::atomic<UnitState> state_{UnitState::idle};
    std::atomic<std::int64_t> remote_size_{UNKNOWN_SIZE};
    std::atomic<bool> running_{false};

    std::error_code last_error_;
    mutable std::mutex error_mutex_;
};

} // namespace reel::core
