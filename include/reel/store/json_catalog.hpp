// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/store/catalog.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace reel::store {

// Catalog kept in a single JSON file, rewritten atomically on every change
class JsonCatalog final : public Catalog {
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    // Use open()
    JsonCatalog(Passkey, std::string path);

    // Open (or create on first write) the catalog at path
    [[nodiscard]] static std::expected<std::unique_ptr<JsonCatalog>, std::error_code>
    open(std::string path) noexcept;

    [[nodiscard]] std::error_code register_unit(const core::UnitDescriptor& descriptor) noexcept override;

    [[nodiscard]] std::expected<std::optional<UnitRecord>, std::error_code>
    load_unit(std::string_view unit_id) noexcept override;

    [[nodiscard]] std::expected<std::vector<UnitRecord>, std::error_code>
    load_units(std::string_view item_id) noexcept override;

    [[nodiscard]] std::expected<std::vector<UnitRecord>, std::error_code>
    load_pending_units(std::string_view item_id) noexcept override;

    [[nodiscard]] std::expected<std::vector<std::string>, std::error_code>
    list_items() noexcept override;

    [[nodiscard]] std::error_code
    persist_unit_state(std::string_view unit_id, core::UnitState state, std::uint64_t bytes_done) noexcept override;

    [[nodiscard]] std::error_code delete_unit_state(std::string_view unit_id) noexcept override;

    [[nodiscard]] std::error_code delete_item(std::string_view item_id) noexcept override;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] std::size_t size() const noexcept;

    static constexpr int FORMAT_VERSION = 1;

private:
    [[nodiscard]] std::error_code load_locked() noexcept;
    [[nodiscard]] std::error_code save_locked() const noexcept;
    [[nodiscard]] std::vector<UnitRecord> collect_locked(std::string_view item_id, bool pending_only) const;

    std::string path_;
    std::map<std::string, UnitRecord, std::less<>> units_;  // By unit id
    std::uint64_t next_sequence_{1};
    mutable std::mutex mutex_;
};

} // namespace reel::store
