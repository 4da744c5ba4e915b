// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/store/json_catalog.hpp>
#include <reel/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>

namespace reel::store {

namespace fs = std::filesystem;

// Format:
// {"version": 1, "next_sequence": N,
//  "units": {"<id>": {<descriptor>, "state": "STOPPED", "bytes": 123, "sequence": 4}}}

JsonCatalog::JsonCatalog(Passkey, std::string path)
    : path_(std::move(path)) {}

std::expected<std::unique_ptr<JsonCatalog>, std::error_code>
JsonCatalog::open(std::string path) noexcept {
    try {
        auto catalog = std::make_unique<JsonCatalog>(Passkey{}, std::move(path));
        std::lock_guard<std::mutex> lock(catalog->mutex_);
        if (auto ec = catalog->load_locked()) {
            return std::unexpected(ec);
        }
        return catalog;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::error_code JsonCatalog::load_locked() noexcept {
    std::error_code fs_ec;
    if (!fs::exists(path_, fs_ec)) {
        return {};  // Empty catalog until the first write
    }

    try {
        std::ifstream file(path_, std::ios::binary);
        if (!file) {
            return make_error_code(disk::DiskErrc::access_denied);
        }

        auto j = nlohmann::json::parse(file);
        if (j.value("version", 0) != FORMAT_VERSION) {
            spdlog::error("Catalog {}: unsupported version", path_);
            return make_error_code(core::TransferErrc::corrupt_catalog);
        }

        next_sequence_ = j.value("next_sequence", std::uint64_t{1});
        for (const auto& [id, entry] : j.at("units").items()) {
            UnitRecord record;
            record.descriptor = entry.get<core::UnitDescriptor>();
            auto state = core::unit_state_from_string(entry.value("state", std::string{"IDLE"}));
            if (!state) {
                return make_error_code(core::TransferErrc::corrupt_catalog);
            }
            record.state = *state;
            record.bytes_done = entry.value("bytes", std::uint64_t{0});
            record.sequence = entry.value("sequence", std::uint64_t{0});
            next_sequence_ = std::max(next_sequence_, record.sequence + 1);
            units_[record.descriptor.id] = std::move(record);
        }
        spdlog::debug("Catalog {}: loaded {} units", path_, units_.size());
        return {};
    } catch (const std::exception& e) {
        spdlog::error("Catalog {} is corrupt: {}", path_, e.what());
        units_.clear();
        return make_error_code(core::TransferErrc::corrupt_catalog);
    }
}

std::error_code JsonCatalog::save_locked() const noexcept {
    try {
        nlohmann::json units = nlohmann::json::object();
        for (const auto& [id, record] : units_) {
            nlohmann::json entry = record.descriptor;
            entry["state"] = std::string(core::to_string(record.state));
            entry["bytes"] = record.bytes_done;
            entry["sequence"] = record.sequence;
            units[id] = std::move(entry);
        }

        nlohmann::json j;
        j["version"] = FORMAT_VERSION;
        j["next_sequence"] = next_sequence_;
        j["units"] = std::move(units);

        fs::path p(path_);
        if (p.has_parent_path()) {
            fs::create_directories(p.parent_path());
        }

        // Write beside the catalog, then swap it in
        const std::string tmp = path_ + ".tmp";
        {
            std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
            if (!file) {
                return make_error_code(disk::DiskErrc::write_error);
            }
            file << j.dump(2) << '\n';
            file.flush();
            if (!file) {
                return make_error_code(disk::DiskErrc::write_error);
            }
        }
        fs::rename(tmp, p);
        return {};
    } catch (const std::exception& e) {
        spdlog::error("Catalog {}: write failed: {}", path_, e.what());
        return make_error_code(disk::DiskErrc::write_error);
    }
}

std::error_code JsonCatalog::register_unit(const core::UnitDescriptor& descriptor) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = units_.find(descriptor.id);
    if (it != units_.end()) {
        if (it->second.descriptor == descriptor && it->second.descriptor.item_id == descriptor.item_id) {
            return {};
        }
        // Same target, new source or owner: the old record no longer describes the file
        it->second.descriptor = descriptor;
        it->second.state = core::UnitState::idle;
        return save_locked();
    }

    UnitRecord record;
    record.descriptor = descriptor;
    record.sequence = next_sequence_++;
    units_.emplace(descriptor.id, std::move(record));
    return save_locked();
}

std::expected<std::optional<UnitRecord>, std::error_code>
JsonCatalog::load_unit(std::string_view unit_id) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = units_.find(unit_id);
    if (it == units_.end()) {
        return std::optional<UnitRecord>{};
    }
    return std::optional<UnitRecord>{it->second};
}

std::vector<UnitRecord> JsonCatalog::collect_locked(std::string_view item_id, bool pending_only) const {
    std::vector<UnitRecord> result;
    for (const auto& [id, record] : units_) {
        if (record.descriptor.item_id != item_id) continue;
        if (pending_only && record.state == core::UnitState::completed) continue;
        result.push_back(record);
    }
    std::sort(result.begin(), result.end(),
              [](const UnitRecord& a, const UnitRecord& b) { return a.sequence < b.sequence; });
    return result;
}

std::expected<std::vector<UnitRecord>, std::error_code>
JsonCatalog::load_units(std::string_view item_id) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        return collect_locked(item_id, false);
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::expected<std::vector<UnitRecord>, std::error_code>
JsonCatalog::load_pending_units(std::string_view item_id) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        return collect_locked(item_id, true);
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::expected<std::vector<std::string>, std::error_code>
JsonCatalog::list_items() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    // Items in order of their first registered unit
    std::vector<const UnitRecord*> records;
    records.reserve(units_.size());
    for (const auto& [id, record] : units_) {
        records.push_back(&record);
    }
    std::sort(records.begin(), records.end(),
              [](const UnitRecord* a, const UnitRecord* b) { return a->sequence < b->sequence; });

    std::vector<std::string> items;
    std::set<std::string, std::less<>> seen;
    for (const auto* record : records) {
        if (seen.insert(record->descriptor.item_id).second) {
            items.push_back(record->descriptor.item_id);
        }
    }
    return items;
}

std::error_code JsonCatalog::persist_unit_state(std::string_view unit_id, core::UnitState state,
                                                std::uint64_t bytes_done) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = units_.find(unit_id);
    if (it == units_.end()) {
        return make_error_code(disk::DiskErrc::file_not_found);
    }
    it->second.state = state;
    it->second.bytes_done = bytes_done;
    return save_locked();
}

std::error_code JsonCatalog::delete_unit_state(std::string_view unit_id) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = units_.find(unit_id);
    if (it == units_.end()) {
        return {};
    }
    units_.erase(it);
    return save_locked();
}

std::error_code JsonCatalog::delete_item(std::string_view item_id) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto removed = std::erase_if(units_, [&](const auto& entry) {
        return entry.second.descriptor.item_id == item_id;
    });
    if (removed == 0) {
        return {};
    }
    return save_locked();
}

std::size_t JsonCatalog::size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return units_.size();
}

} // namespace reel::store
