// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/transfer_unit.hpp>
#include <reel/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <utility>

namespace reel::core {

namespace fs = std::filesystem;

namespace {

// Clears the running flag on every exit path
struct RunningGuard {
    std::atomic<bool>& flag;
    ~RunningGuard() { flag.store(false, std::memory_order_release); }
};

} // namespace

std::string_view to_string(UnitState state) noexcept {
    switch (state) {
        case UnitState::idle:        return "IDLE";
        case UnitState::in_progress: return "IN_PROGRESS";
        case UnitState::completed:   return "COMPLETED";
        case UnitState::stopped:     return "STOPPED";
        case UnitState::error:       return "ERROR";
    }
    return "IDLE";
}

std::optional<UnitState> unit_state_from_string(std::string_view name) noexcept {
    if (name == "IDLE") return UnitState::idle;
    if (name == "IN_PROGRESS") return UnitState::in_progress;
    if (name == "COMPLETED") return UnitState::completed;
    if (name == "STOPPED") return UnitState::stopped;
    if (name == "ERROR") return UnitState::error;
    return std::nullopt;
}

//=============================================================================
// TransferUnit
//=============================================================================

TransferUnit::TransferUnit(UnitDescriptor descriptor) noexcept
    : descriptor_(std::move(descriptor)) {}

std::uint64_t TransferUnit::local_size() const noexcept {
    return disk::file_size_or_zero(descriptor_.target_path);
}

UnitState TransferUnit::run(HttpTransport& transport,
                            ProgressReporter& reporter,
                            std::stop_token stop,
                            const TransferOptions& options) noexcept {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        spdlog::warn("Unit {}: {}", id(), make_error_code(TransferErrc::already_running).message());
        return state();
    }
    RunningGuard guard{running_};

    state_.store(UnitState::idle, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        last_error_.clear();
    }

    const fs::path target{descriptor_.target_path};
    spdlog::debug("Unit {}: download {} to {}", id(), url(), target.string());

    if (auto ec = disk::ensure_parent_dir(target)) {
        spdlog::error("Unit {}: can't create parent dir of {}", id(), target.string());
        return settle(reporter, UnitState::error, ec);
    }

    state_.store(UnitState::in_progress, std::memory_order_release);
    reporter.on_progress(id(), UnitState::in_progress, 0);

    // Size probe is best effort; only cancellation ends the run here
    std::int64_t remote_size = UNKNOWN_SIZE;
    auto probed = transport.probe_size(url(), stop);
    if (probed) {
        remote_size = *probed;
    } else if (probed.error() == TransferErrc::cancelled) {
        spdlog::debug("Unit {}: interrupted during size probe", id());
        return settle(reporter, UnitState::stopped, probed.error());
    } else {
        spdlog::warn("Unit {}: HEAD request failed for {}: {}", id(), url(), probed.error().message());
    }
    remote_size_.store(remote_size, std::memory_order_relaxed);

    std::uint64_t local_size = disk::file_size_or_zero(target);

    if (remote_size >= 0) {
        const auto remote = static_cast<std::uint64_t>(remote_size);
        if (local_size == remote) {
            // Nothing to transfer. Make sure an empty resource still leaves a file.
            std::error_code exists_ec;
            if (remote == 0 && !fs::exists(target, exists_ec)) {
                disk::FileWriter touch;
                if (auto ec = touch.open_append(target.string())) {
                    return settle(reporter, UnitState::error, ec);
                }
            }
            return settle(reporter, UnitState::completed, {});
        }
        if (local_size > remote) {
            spdlog::warn("Unit {}: target is longer than remote ({} > {}), deleting it",
                         id(), local_size, remote);
            if (auto ec = disk::remove_file(target)) {
                spdlog::error("Unit {}: can't delete {}", id(), target.string());
                return settle(reporter, UnitState::error, ec);
            }
            reporter.on_truncated(id(), local_size);
            local_size = 0;
        }
    }

    disk::FileWriter writer;
    if (auto ec = writer.open_append(target.string())) {
        spdlog::warn("Unit {}: can't open {}: {}", id(), target.string(), ec.message());
        return settle(reporter, UnitState::error, ec);
    }

    std::uint64_t pending_bytes = 0;   // Written but not yet reported
    std::uint32_t read_count = 0;
    const std::uint32_t report_every = options.progress_report_count > 0 ? options.progress_report_count : 1;

    auto on_chunk = [&](std::string_view chunk) -> std::error_code {
        ++read_count;

        if (!chunk.empty()) {
            if (stop.stop_requested()) {
                return make_error_code(TransferErrc::cancelled);
            }
            if (auto ec = writer.write(chunk.data(), chunk.size())) {
                return ec;
            }
            pending_bytes += chunk.size();
        }

        if (pending_bytes > 0 && read_count >= report_every) {
            reporter.on_progress(id(), UnitState::in_progress, pending_bytes);
            pending_bytes = 0;
            read_count = 0;
        }
        return {};
    };

    if (local_size > 0) {
        spdlog::debug("Unit {}: resuming at offset {}", id(), local_size);
    }

    std::error_code ec = transport.fetch(url(), local_size, stop, on_chunk);
    if (!ec) {
        ec = writer.flush();   // On disk before COMPLETED is recorded
    }
    writer.close();

    // Bytes still waiting to be reported
    if (pending_bytes > 0) {
        reporter.on_progress(id(), UnitState::in_progress, pending_bytes);
        pending_bytes = 0;
    }

    if (!ec && remote_size >= 0) {
        auto final_size = disk::file_size_or_zero(target);
        if (final_size != static_cast<std::uint64_t>(remote_size)) {
            spdlog::warn("Unit {}: size mismatch after transfer ({} != {})", id(), final_size, remote_size);
            ec = make_error_code(TransferErrc::size_mismatch);
        }
    }

    if (!ec) {
        return settle(reporter, UnitState::completed, {});
    }
    if (ec == TransferErrc::cancelled) {
        spdlog::debug("Unit {}: interrupted", id());
        return settle(reporter, UnitState::stopped, ec);
    }

    spdlog::warn("Unit {}: failed: {}", id(), ec.message());
    return settle(reporter, UnitState::error, ec);
}

UnitState TransferUnit::settle(ProgressReporter& reporter, UnitState state, std::error_code ec) noexcept {
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        last_error_ = ec;
    }
    state_.store(state, std::memory_order_release);
    spdlog::debug("Unit {}: {}", id(), to_string(state));
    reporter.on_progress(id(), state, 0);
    return state;
}

} // namespace reel::core
