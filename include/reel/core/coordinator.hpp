// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/core/error.hpp>
#include <reel/core/http_session.hpp>
#include <reel/core/transfer_unit.hpp>
#include <reel/store/catalog.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

namespace reel::core {

// One resource of an item: where it comes from, where it goes
struct ResourceSpec {
    std::string url;
    std::string target_path;
    std::string track_ref;
};

// Unit lifecycle notification (run started, or terminal state reached)
struct UnitEvent {
    std::string unit_id;
    std::string item_id;
    std::string target_path;
    UnitState state{UnitState::idle};
    std::uint64_t bytes_done{0};
    std::error_code error;
};

// Aggregate progress of one item
struct ItemProgress {
    std::string item_id;
    std::uint64_t bytes_done{0};
    std::int64_t bytes_total{UNKNOWN_SIZE};   // Known only when every unit's size is known
    std::uint32_t total_units{0};
    std::uint32_t running_units{0};
    std::uint32_t queued_units{0};
    std::uint32_t completed_units{0};
    std::uint32_t stopped_units{0};
    std::uint32_t failed_units{0};
    bool completed{false};

    [[nodiscard]] double percent() const noexcept {
        if (bytes_total <= 0) {
            return completed ? 100.0 : 0.0;
        }
        return 100.0 * static_cast<double>(bytes_done) / static_cast<double>(bytes_total);
    }
};

// Host callbacks. Called from worker threads, never with the coordinator lock held.
struct CoordinatorEvents {
    std::function<void(const UnitEvent&)> on_unit_state;
    std::function<void(const ItemProgress&)> on_item_progress;
    std::function<void(const std::string& item_id)> on_item_completed;
};

// Schedules transfer units of many items over a fixed pool of workers.
// FIFO within an item, round-robin across items, at most concurrency_cap running.
class TaskCoordinator final : private ProgressReporter {
public:
    TaskCoordinator(EngineConfig config,
                    HttpTransport& transport,
                    store::Catalog& catalog,
                    CoordinatorEvents events = {});
    ~TaskCoordinator() override;

    TaskCoordinator(const TaskCoordinator&) = delete;
    TaskCoordinator& operator=(const TaskCoordinator&) = delete;
    TaskCoordinator(TaskCoordinator&&) = delete;
    TaskCoordinator& operator=(TaskCoordinator&&) = delete;

    // Register the item's resources and schedule the units that are not terminal
    // and not already queued or running. STOPPED and ERROR units are left to
    // resume(). Calling it again with the same resources does nothing new.
    [[nodiscard]] std::error_code enqueue_item(std::string_view item_id,
                                               const std::vector<ResourceSpec>& resources) noexcept;

    // Stop running units and withdraw queued ones. Does not wait.
    void pause(std::string_view item_id) noexcept;
    void pause_all() noexcept;

    // Re-queue every unit of the item that is not COMPLETED. Completed items
    // are archived and no longer known here.
    [[nodiscard]] std::error_code resume(std::string_view item_id) noexcept;

    // Stop the item, then delete its files and catalog state once its units settle
    [[nodiscard]] std::error_code cancel_and_delete(std::string_view item_id) noexcept;

    // Live aggregate, or the final one for an archived item
    [[nodiscard]] std::expected<ItemProgress, std::error_code> progress(std::string_view item_id) const noexcept;

    // Rebuild items with unfinished units from the catalog and schedule them.
    // Returns the number of items restored.
    [[nodiscard]] std::expected<std::size_t, std::error_code> restore() noexcept;

    // Active items in round-robin order, then archived ones
    [[nodiscard]] std::vector<std::string> items() const noexcept;
    [[nodiscard]] std::size_t unit_count() const noexcept;   // Units of active items
    [[nodiscard]] std::uint32_t running_count() const noexcept;
    [[nodiscard]] std::size_t pending_count() const noexcept;

    // Block until nothing is running or queued
    void wait_idle() noexcept;
    [[nodiscard]] bool wait_idle_for(std::chrono::milliseconds timeout) noexcept;

    // Stop everything and join the workers. Safe to call twice.
    void shutdown() noexcept;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    struct UnitSlot {
        std::unique_ptr<TransferUnit> unit;
        UnitState state{UnitState::idle};     // Last state seen by the coordinator
        std::uint64_t bytes_done{0};
        std::int64_t remote_size{UNKNOWN_SIZE};
        bool queued{false};
        bool running{false};
        bool started{false};                  // First callback of the current run seen
        bool resume_after_settle{false};
        std::stop_source stop;
        std::chrono::steady_clock::time_point last_persist;
    };

    struct ItemEntry {
        std::string id;
        std::vector<std::string> unit_ids;    // Enqueue order
        std::deque<std::string> pending;      // Queued unit ids, FIFO
        std::uint32_t running{0};
        std::uint64_t bytes_done{0};
        bool completed_reported{false};
        bool deleting{false};
    };

    struct PersistOp {
        std::string unit_id;
        UnitState state{UnitState::idle};
        std::uint64_t bytes_done{0};
    };

    // Catalog writes, file deletion and host events, run after the lock is dropped
    struct Deferred {
        std::vector<PersistOp> persist;
        std::vector<UnitEvent> unit_events;
        std::vector<ItemProgress> item_progress;
        std::vector<std::string> completed_items;
        std::vector<std::string> delete_files;
        std::string delete_item;
    };

    void on_progress(const std::string& unit_id, UnitState state, std::uint64_t bytes) noexcept override;
    void on_truncated(const std::string& unit_id, std::uint64_t discarded_bytes) noexcept override;

    void worker_loop(std::stop_token stoken) noexcept;
    void finish_run(const std::string& unit_id) noexcept;

    [[nodiscard]] bool conflicts_locked(const std::vector<UnitDescriptor>& descriptors) const noexcept;
    [[nodiscard]] bool has_admissible_locked() const noexcept;
    [[nodiscard]] UnitSlot* admit_next_locked(std::string& unit_id) noexcept;
    [[nodiscard]] bool queue_locked(ItemEntry& item, const std::string& unit_id) noexcept;
    void withdraw_locked(ItemEntry& item) noexcept;
    void stop_item_locked(ItemEntry& item) noexcept;
    void purge_item_locked(const std::string& item_id, Deferred& out) noexcept;
    void archive_item_locked(const std::string& item_id) noexcept;
    void forget_item_locked(const std::string& item_id) noexcept;
    [[nodiscard]] bool item_completed_locked(const ItemEntry& item) const noexcept;
    [[nodiscard]] ItemProgress snapshot_locked(const ItemEntry& item) const noexcept;
    [[nodiscard]] UnitEvent unit_event_locked(const UnitSlot& slot) const noexcept;
    void notify_idle_locked() noexcept;

    void run_deferred(Deferred& work) noexcept;

    EngineConfig config_;
    HttpTransport& transport_;
    store::Catalog& catalog_;
    CoordinatorEvents events_;

    std::unordered_map<std::string, UnitSlot> units_;    // By unit id
    std::unordered_map<std::string, ItemEntry> items_;   // By item id
    std::vector<std::string> item_order_;                // Round-robin order
    std::unordered_map<std::string, ItemProgress> archived_;   // Completed items, final aggregate
    std::vector<std::string> archived_order_;
    std::size_t rr_cursor_{0};
    std::uint32_t running_{0};
    std::size_t pending_{0};
    bool shutting_down_{false};

    mutable std::mutex mutex_;
    std::condition_variable_any work_cv_;
    std::condition_variable idle_cv_;
    std::vector<std::jthread> workers_;
};

} // namespace reel::core
