// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/coordinator.hpp>
#include <reel/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <optional>

namespace reel::core {

namespace fs = std::filesystem;

TaskCoordinator::TaskCoordinator(EngineConfig config,
                                 HttpTransport& transport,
                                 store::Catalog& catalog,
                                 CoordinatorEvents events)
    : config_(std::move(config))
    , transport_(transport)
    , catalog_(catalog)
    , events_(std::move(events)) {
    const std::uint32_t workers = std::max<std::uint32_t>(config_.concurrency_cap, 1);
    workers_.reserve(workers);
    for (std::uint32_t i = 0; i < workers; ++i) {
        workers_.emplace_back([this](std::stop_token stoken) { worker_loop(stoken); });
    }
    spdlog::debug("Coordinator: {} workers, per-item cap {}", workers, config_.per_item_cap);
}

TaskCoordinator::~TaskCoordinator() {
    shutdown();
}

//=============================================================================
// Public API
//=============================================================================

std::error_code TaskCoordinator::enqueue_item(std::string_view item_id,
                                              const std::vector<ResourceSpec>& resources) noexcept {
    if (item_id.empty()) {
        return make_error_code(TransferErrc::unknown_item);
    }

    try {
        const std::string key(item_id);

        std::vector<UnitDescriptor> descriptors;
        descriptors.reserve(resources.size());
        for (const auto& resource : resources) {
            auto descriptor = UnitDescriptor::make(resource.url, resource.target_path, key, resource.track_ref);
            if (!descriptor) {
                spdlog::warn("Item {}: rejected resource {}: {}", key, resource.url,
                             descriptor.error().message());
                return descriptor.error();
            }
            auto same_target = std::find_if(descriptors.begin(), descriptors.end(),
                [&](const UnitDescriptor& d) { return d.id == descriptor->id; });
            if (same_target != descriptors.end()) {
                if (*same_target == *descriptor) {
                    continue;  // Listed twice
                }
                return make_error_code(TransferErrc::target_conflict);
            }
            descriptors.push_back(std::move(*descriptor));
        }

        // Catalog and filesystem lookups happen without the lock
        struct Lookup {
            std::optional<store::UnitRecord> record;
            std::uint64_t on_disk{0};
            bool exists{false};
        };
        std::vector<Lookup> lookups(descriptors.size());
        for (std::size_t i = 0; i < descriptors.size(); ++i) {
            const auto& d = descriptors[i];
            auto loaded = catalog_.load_unit(d.id);
            if (loaded) {
                lookups[i].record = std::move(*loaded);
            } else {
                spdlog::warn("Catalog: can't load unit {}: {}", d.id, loaded.error().message());
            }
            std::error_code fs_ec;
            lookups[i].exists = fs::exists(d.target_path, fs_ec);
            lookups[i].on_disk = disk::file_size_or_zero(d.target_path);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutting_down_) {
                return make_error_code(TransferErrc::shutting_down);
            }
            auto it = items_.find(key);
            if (it != items_.end() && it->second.deleting) {
                return make_error_code(TransferErrc::item_busy);
            }
            if (conflicts_locked(descriptors)) {
                return make_error_code(TransferErrc::target_conflict);
            }
            // Targets of archived items stay theirs
            for (std::size_t i = 0; i < descriptors.size(); ++i) {
                const auto& record = lookups[i].record;
                if (record && archived_.contains(record->descriptor.item_id) &&
                    (record->descriptor.item_id != key || !(record->descriptor == descriptors[i]))) {
                    spdlog::warn("Target {} already belongs to {} ({})", descriptors[i].target_path,
                                 record->descriptor.url, record->descriptor.item_id);
                    return make_error_code(TransferErrc::target_conflict);
                }
            }
        }

        for (const auto& d : descriptors) {
            if (auto ec = catalog_.register_unit(d)) {
                spdlog::error("Catalog: can't register unit {}: {}", d.id, ec.message());
            }
        }

        Deferred work;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutting_down_) {
                return make_error_code(TransferErrc::shutting_down);
            }
            // Re-checked: another caller may have claimed a target meanwhile
            if (conflicts_locked(descriptors)) {
                return make_error_code(TransferErrc::target_conflict);
            }

            auto [it, inserted] = items_.try_emplace(key);
            auto& item = it->second;
            const bool was_archived = inserted && archived_.contains(key);
            if (inserted) {
                item.id = key;
                item_order_.push_back(key);
            } else if (item.deleting) {
                return make_error_code(TransferErrc::item_busy);
            }

            // New units are scheduled. Known ones only while still IDLE: STOPPED
            // and ERROR units wait for resume().
            bool queued_any = false;
            for (std::size_t i = 0; i < descriptors.size(); ++i) {
                const auto& d = descriptors[i];
                auto unit_it = units_.find(d.id);
                if (unit_it == units_.end()) {
                    UnitSlot slot;
                    slot.unit = std::make_unique<TransferUnit>(d);
                    slot.bytes_done = lookups[i].on_disk;

                    // Trust a COMPLETED record only while the file still matches it
                    const auto& record = lookups[i].record;
                    if (record && record->state == UnitState::completed && lookups[i].exists &&
                        record->bytes_done == lookups[i].on_disk) {
                        slot.state = UnitState::completed;
                        slot.remote_size = static_cast<std::int64_t>(record->bytes_done);
                    }

                    item.bytes_done += slot.bytes_done;
                    item.unit_ids.push_back(d.id);
                    unit_it = units_.emplace(d.id, std::move(slot)).first;
                } else if (unit_it->second.state != UnitState::idle) {
                    continue;
                }
                if (queue_locked(item, d.id)) {
                    queued_any = true;
                }
            }

            spdlog::debug("Item {}: {} units, {} queued", key, item.unit_ids.size(), item.pending.size());
            if (queued_any) {
                item.completed_reported = false;
                work_cv_.notify_all();
            } else if (item.running == 0 && item_completed_locked(item)) {
                // Nothing left to do. An item that was archived before was reported then.
                if (!item.completed_reported && !was_archived) {
                    work.completed_items.push_back(key);
                }
                item.completed_reported = true;
                archive_item_locked(key);   // Invalidates item
            }
            if (was_archived && items_.contains(key)) {
                archived_.erase(key);
                std::erase(archived_order_, key);
            }
        }

        run_deferred(work);
        return {};
    } catch (const std::bad_alloc&) {
        return std::make_error_code(std::errc::not_enough_memory);
    }
}

void TaskCoordinator::pause(std::string_view item_id) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = items_.find(std::string(item_id));
    if (it == items_.end()) {
        spdlog::debug("Pause: unknown item {}", item_id);
        return;
    }
    stop_item_locked(it->second);
    notify_idle_locked();
}

void TaskCoordinator::pause_all() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, item] : items_) {
        stop_item_locked(item);
    }
    notify_idle_locked();
}

std::error_code TaskCoordinator::resume(std::string_view item_id) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_) {
        return make_error_code(TransferErrc::shutting_down);
    }
    const std::string key(item_id);
    auto it = items_.find(key);
    if (it == items_.end()) {
        // Archived items have nothing left to run
        return archived_.contains(key) ? std::error_code{} : make_error_code(TransferErrc::unknown_item);
    }
    auto& item = it->second;
    if (item.deleting) {
        return make_error_code(TransferErrc::item_busy);
    }

    for (const auto& unit_id : item.unit_ids) {
        auto& slot = units_.at(unit_id);
        if (slot.running) {
            // Still settling from a pause: queue it once it has
            if (slot.stop.stop_requested()) {
                slot.resume_after_settle = true;
            }
            continue;
        }
        (void)queue_locked(item, unit_id);
    }
    work_cv_.notify_all();
    return {};
}

std::error_code TaskCoordinator::cancel_and_delete(std::string_view item_id) noexcept {
    try {
        const std::string key(item_id);
        Deferred work;
        bool known = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            archived_.erase(key);
            std::erase(archived_order_, key);
            auto it = items_.find(key);
            if (it != items_.end()) {
                known = true;
                auto& item = it->second;
                item.deleting = true;
                stop_item_locked(item);
                if (item.running == 0) {
                    purge_item_locked(key, work);
                } else {
                    spdlog::debug("Item {}: deleting after {} units settle", key, item.running);
                }
                notify_idle_locked();
            }
        }

        if (!known) {
            // Not loaded in this process; the catalog still knows its files
            auto units = catalog_.load_units(key);
            if (!units) {
                return units.error();
            }
            if (units->empty()) {
                return make_error_code(TransferErrc::unknown_item);
            }
            for (const auto& record : *units) {
                work.delete_files.push_back(record.descriptor.target_path);
            }
            work.delete_item = key;
        }

        run_deferred(work);
        return {};
    } catch (const std::bad_alloc&) {
        return std::make_error_code(std::errc::not_enough_memory);
    }
}

std::expected<ItemProgress, std::error_code>
TaskCoordinator::progress(std::string_view item_id) const noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::string key(item_id);
        auto it = items_.find(key);
        if (it != items_.end()) {
            return snapshot_locked(it->second);
        }
        auto archived = archived_.find(key);
        if (archived != archived_.end()) {
            return archived->second;
        }
        return std::unexpected(make_error_code(TransferErrc::unknown_item));
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::expected<std::size_t, std::error_code> TaskCoordinator::restore() noexcept {
    auto item_ids = catalog_.list_items();
    if (!item_ids) {
        return std::unexpected(item_ids.error());
    }

    std::size_t restored = 0;
    try {
        for (const auto& item_id : *item_ids) {
            auto pending = catalog_.load_pending_units(item_id);
            if (!pending) {
                return std::unexpected(pending.error());
            }
            if (pending->empty()) {
                continue;  // Finished in an earlier run
            }

            auto units = catalog_.load_units(item_id);
            if (!units) {
                return std::unexpected(units.error());
            }

            std::vector<ResourceSpec> resources;
            resources.reserve(units->size());
            for (const auto& record : *units) {
                resources.push_back({record.descriptor.url, record.descriptor.target_path,
                                     record.descriptor.track_ref});
            }

            if (auto ec = enqueue_item(item_id, resources)) {
                spdlog::warn("Item {}: can't restore: {}", item_id, ec.message());
                continue;
            }
            ++restored;
        }
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }

    spdlog::info("Restored {} items from the catalog", restored);
    return restored;
}

std::vector<std::string> TaskCoordinator::items() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids = item_order_;
    ids.insert(ids.end(), archived_order_.begin(), archived_order_.end());
    return ids;
}

std::size_t TaskCoordinator::unit_count() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return units_.size();
}

std::uint32_t TaskCoordinator::running_count() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

std::size_t TaskCoordinator::pending_count() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

void TaskCoordinator::wait_idle() noexcept {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return running_ == 0 && pending_ == 0; });
}

bool TaskCoordinator::wait_idle_for(std::chrono::milliseconds timeout) noexcept {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return running_ == 0 && pending_ == 0; });
}

void TaskCoordinator::shutdown() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_ && workers_.empty()) {
            return;
        }
        shutting_down_ = true;
        for (auto& [id, item] : items_) {
            stop_item_locked(item);
        }
        notify_idle_locked();
    }
    work_cv_.notify_all();

    for (auto& worker : workers_) {
        worker.request_stop();
    }
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    spdlog::debug("Coordinator: shut down");
}

//=============================================================================
// Worker pool
//=============================================================================

void TaskCoordinator::worker_loop(std::stop_token stoken) noexcept {
    const TransferOptions options{config_.progress_report_count};

    while (!stoken.stop_requested()) {
        std::string unit_id;
        TransferUnit* unit = nullptr;
        std::stop_token unit_stop;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, stoken, [this] { return shutting_down_ || has_admissible_locked(); });
            if (stoken.stop_requested() || shutting_down_) {
                return;
            }
            UnitSlot* slot = admit_next_locked(unit_id);
            if (!slot) {
                continue;
            }
            unit = slot->unit.get();
            unit_stop = slot->stop.get_token();
        }

        unit->run(transport_, *this, unit_stop, options);
        finish_run(unit_id);
    }
}

void TaskCoordinator::finish_run(const std::string& unit_id) noexcept {
    Deferred work;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = units_.find(unit_id);
        if (it != units_.end()) {
            auto& slot = it->second;
            slot.running = false;

            auto item_it = items_.find(slot.unit->item_id());
            if (item_it != items_.end()) {
                auto& item = item_it->second;
                --item.running;
                if (item.deleting) {
                    if (item.running == 0) {
                        const std::string item_id = item.id;
                        purge_item_locked(item_id, work);   // Invalidates slot and item
                    }
                } else {
                    if (slot.resume_after_settle) {
                        slot.resume_after_settle = false;
                        if (!shutting_down_) {
                            (void)queue_locked(item, unit_id);
                        }
                    }
                    if (item.running == 0 && item.completed_reported && item_completed_locked(item)) {
                        const std::string item_id = item.id;
                        archive_item_locked(item_id);   // Invalidates slot and item
                    }
                }
            }
        }
    }

    // Deletion finishes before this worker counts as idle
    run_deferred(work);

    std::lock_guard<std::mutex> lock(mutex_);
    --running_;
    work_cv_.notify_all();
    notify_idle_locked();
}

//=============================================================================
// Progress callbacks (worker threads)
//=============================================================================

void TaskCoordinator::on_progress(const std::string& unit_id, UnitState state, std::uint64_t bytes) noexcept {
    Deferred work;
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = units_.find(unit_id);
        if (it == units_.end()) {
            return;
        }
        auto& slot = it->second;
        auto item_it = items_.find(slot.unit->item_id());
        if (item_it == items_.end()) {
            return;
        }
        auto& item = item_it->second;

        slot.remote_size = slot.unit->remote_size();
        const auto now = std::chrono::steady_clock::now();

        if (state == UnitState::in_progress) {
            slot.state = UnitState::in_progress;
            slot.bytes_done += bytes;
            item.bytes_done += bytes;

            if (!slot.started) {
                slot.started = true;
                slot.last_persist = now;
                work.unit_events.push_back(unit_event_locked(slot));
                if (!item.deleting) {
                    work.persist.push_back({unit_id, state, slot.bytes_done});
                }
            } else if (!item.deleting && now - slot.last_persist >= CATALOG_SAVE_INTERVAL) {
                slot.last_persist = now;
                work.persist.push_back({unit_id, state, slot.bytes_done});
            }

            if (bytes > 0) {
                work.item_progress.push_back(snapshot_locked(item));
            }
        } else {
            slot.state = state;
            slot.last_persist = now;
            work.unit_events.push_back(unit_event_locked(slot));

            if (!item.deleting) {
                work.persist.push_back({unit_id, state, slot.bytes_done});
                if (state == UnitState::completed && !item.completed_reported && item_completed_locked(item)) {
                    item.completed_reported = true;
                    work.completed_items.push_back(item.id);
                }
            }
            work.item_progress.push_back(snapshot_locked(item));
        }
    } catch (const std::bad_alloc&) {
        spdlog::error("Unit {}: out of memory while recording progress", unit_id);
        return;
    }

    run_deferred(work);
}

void TaskCoordinator::on_truncated(const std::string& unit_id, std::uint64_t discarded_bytes) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = units_.find(unit_id);
    if (it == units_.end()) {
        return;
    }
    auto& slot = it->second;
    const std::uint64_t undone = std::min(discarded_bytes, slot.bytes_done);
    slot.bytes_done -= undone;

    auto item_it = items_.find(slot.unit->item_id());
    if (item_it != items_.end()) {
        item_it->second.bytes_done -= std::min(undone, item_it->second.bytes_done);
    }
}

//=============================================================================
// Locked helpers
//=============================================================================

bool TaskCoordinator::conflicts_locked(const std::vector<UnitDescriptor>& descriptors) const noexcept {
    for (const auto& d : descriptors) {
        auto it = units_.find(d.id);
        if (it == units_.end()) {
            continue;
        }
        const auto& known = it->second.unit->descriptor();
        if (!(known == d) || known.item_id != d.item_id) {
            spdlog::warn("Target {} already belongs to {} ({})", d.target_path, known.url, known.item_id);
            return true;
        }
    }
    return false;
}

bool TaskCoordinator::has_admissible_locked() const noexcept {
    for (const auto& [id, item] : items_) {
        if (item.pending.empty()) continue;
        if (config_.per_item_cap > 0 && item.running >= config_.per_item_cap) continue;
        return true;
    }
    return false;
}

TaskCoordinator::UnitSlot* TaskCoordinator::admit_next_locked(std::string& unit_id) noexcept {
    const std::size_t count = item_order_.size();
    for (std::size_t i = 0; i < count; ++i) {
        const std::size_t index = (rr_cursor_ + i) % count;
        auto item_it = items_.find(item_order_[index]);
        if (item_it == items_.end()) continue;

        auto& item = item_it->second;
        if (item.pending.empty()) continue;
        if (config_.per_item_cap > 0 && item.running >= config_.per_item_cap) continue;

        unit_id = std::move(item.pending.front());
        item.pending.pop_front();
        --pending_;
        rr_cursor_ = index + 1;   // Taken modulo the item count on the next pass

        auto& slot = units_.at(unit_id);
        slot.queued = false;
        slot.running = true;
        slot.started = false;
        slot.state = UnitState::in_progress;
        slot.stop = std::stop_source{};
        ++item.running;
        ++running_;

        // Re-base on the partial file actually on disk
        const std::uint64_t on_disk = slot.unit->local_size();
        item.bytes_done = item.bytes_done - std::min(slot.bytes_done, item.bytes_done) + on_disk;
        slot.bytes_done = on_disk;

        spdlog::debug("Unit {}: admitted ({} running, {} queued)", unit_id, running_, pending_);
        return &slot;
    }
    return nullptr;
}

bool TaskCoordinator::queue_locked(ItemEntry& item, const std::string& unit_id) noexcept {
    auto it = units_.find(unit_id);
    if (it == units_.end()) {
        return false;
    }
    auto& slot = it->second;
    if (slot.queued || slot.running || slot.state == UnitState::completed) {
        return false;
    }
    slot.queued = true;
    item.pending.push_back(unit_id);
    ++pending_;
    return true;
}

void TaskCoordinator::withdraw_locked(ItemEntry& item) noexcept {
    for (const auto& unit_id : item.pending) {
        auto it = units_.find(unit_id);
        if (it != units_.end()) {
            it->second.queued = false;
        }
    }
    pending_ -= item.pending.size();
    item.pending.clear();
}

void TaskCoordinator::stop_item_locked(ItemEntry& item) noexcept {
    withdraw_locked(item);
    for (const auto& unit_id : item.unit_ids) {
        auto it = units_.find(unit_id);
        if (it == units_.end()) continue;
        auto& slot = it->second;
        slot.resume_after_settle = false;
        if (slot.running) {
            slot.stop.request_stop();
        }
    }
}

void TaskCoordinator::purge_item_locked(const std::string& item_id, Deferred& out) noexcept {
    auto it = items_.find(item_id);
    if (it == items_.end()) {
        return;
    }
    for (const auto& unit_id : it->second.unit_ids) {
        auto unit_it = units_.find(unit_id);
        if (unit_it == units_.end()) continue;
        out.delete_files.push_back(unit_it->second.unit->target_path());
        units_.erase(unit_it);
    }

    out.delete_item = item_id;
    forget_item_locked(item_id);
}

void TaskCoordinator::archive_item_locked(const std::string& item_id) noexcept {
    auto it = items_.find(item_id);
    if (it == items_.end()) {
        return;
    }
    try {
        auto [entry, inserted] = archived_.insert_or_assign(item_id, snapshot_locked(it->second));
        if (inserted) {
            archived_order_.push_back(item_id);
        }
    } catch (const std::bad_alloc&) {
        spdlog::error("Item {}: out of memory, keeping it loaded", item_id);
        return;
    }

    for (const auto& unit_id : it->second.unit_ids) {
        units_.erase(unit_id);
    }
    spdlog::debug("Item {}: complete, archived", item_id);
    forget_item_locked(item_id);
}

void TaskCoordinator::forget_item_locked(const std::string& item_id) noexcept {
    auto pos = std::find(item_order_.begin(), item_order_.end(), item_id);
    if (pos != item_order_.end()) {
        // Keep the round-robin cursor on the item it pointed at
        if (static_cast<std::size_t>(pos - item_order_.begin()) < rr_cursor_) {
            --rr_cursor_;
        }
        item_order_.erase(pos);
    }
    if (rr_cursor_ >= item_order_.size()) {
        rr_cursor_ = 0;
    }
    items_.erase(item_id);
}

bool TaskCoordinator::item_completed_locked(const ItemEntry& item) const noexcept {
    if (item.unit_ids.empty()) {
        return false;
    }
    return std::all_of(item.unit_ids.begin(), item.unit_ids.end(), [this](const std::string& unit_id) {
        auto it = units_.find(unit_id);
        return it != units_.end() && it->second.state == UnitState::completed;
    });
}

ItemProgress TaskCoordinator::snapshot_locked(const ItemEntry& item) const noexcept {
    ItemProgress p;
    p.item_id = item.id;
    p.bytes_done = item.bytes_done;
    p.total_units = static_cast<std::uint32_t>(item.unit_ids.size());

    bool total_known = !item.unit_ids.empty();
    std::int64_t total = 0;
    for (const auto& unit_id : item.unit_ids) {
        auto it = units_.find(unit_id);
        if (it == units_.end()) continue;
        const auto& slot = it->second;

        if (slot.queued) {
            ++p.queued_units;
        } else {
            switch (slot.state) {
                case UnitState::in_progress: ++p.running_units; break;
                case UnitState::completed:   ++p.completed_units; break;
                case UnitState::stopped:     ++p.stopped_units; break;
                case UnitState::error:       ++p.failed_units; break;
                case UnitState::idle:        break;
            }
        }

        if (slot.remote_size < 0) {
            total_known = false;
        } else {
            total += slot.remote_size;
        }
    }

    p.bytes_total = total_known ? total : UNKNOWN_SIZE;
    p.completed = item_completed_locked(item);
    return p;
}

UnitEvent TaskCoordinator::unit_event_locked(const UnitSlot& slot) const noexcept {
    UnitEvent ev;
    ev.unit_id = slot.unit->id();
    ev.item_id = slot.unit->item_id();
    ev.target_path = slot.unit->target_path();
    ev.state = slot.state;
    ev.bytes_done = slot.bytes_done;
    ev.error = slot.unit->last_error();
    return ev;
}

void TaskCoordinator::notify_idle_locked() noexcept {
    if (running_ == 0 && pending_ == 0) {
        idle_cv_.notify_all();
    }
}

//=============================================================================
// Deferred work (no lock held)
//=============================================================================

void TaskCoordinator::run_deferred(Deferred& work) noexcept {
    for (const auto& op : work.persist) {
        if (auto ec = catalog_.persist_unit_state(op.unit_id, op.state, op.bytes_done)) {
            spdlog::error("Catalog: can't save unit {}: {}", op.unit_id, ec.message());
        }
    }

    for (const auto& path : work.delete_files) {
        if (auto ec = disk::remove_file(path)) {
            spdlog::warn("Can't delete {}: {}", path, ec.message());
        }
    }
    if (!work.delete_item.empty()) {
        if (auto ec = catalog_.delete_item(work.delete_item)) {
            spdlog::error("Catalog: can't delete item {}: {}", work.delete_item, ec.message());
        }
        spdlog::info("Item {} deleted", work.delete_item);
    }

    try {
        if (events_.on_unit_state) {
            for (const auto& ev : work.unit_events) {
                events_.on_unit_state(ev);
            }
        }
        if (events_.on_item_progress) {
            for (const auto& p : work.item_progress) {
                events_.on_item_progress(p);
            }
        }
        if (events_.on_item_completed) {
            for (const auto& item_id : work.completed_items) {
                events_.on_item_completed(item_id);
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Host event handler threw: {}", e.what());
    }
}

} // namespace reel::core
