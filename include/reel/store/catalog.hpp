// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/transfer_unit.hpp>
#include <reel/core/unit_descriptor.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace reel::store {

// Persisted state of one transfer unit
struct UnitRecord {
    core::UnitDescriptor descriptor;
    core::UnitState state{core::UnitState::idle};
    std::uint64_t bytes_done{0};
    std::uint64_t sequence{0};   // Registration order, FIFO within an item
};

// Durable store the coordinator rebuilds its work queue from after a restart.
// Implementations must be safe to call from several threads.
class Catalog {
public:
    virtual ~Catalog() = default;

    // Record a unit. Re-registering a known unit keeps its state and bytes.
    [[nodiscard]] virtual std::error_code register_unit(const core::UnitDescriptor& descriptor) noexcept = 0;

    [[nodiscard]] virtual std::expected<std::optional<UnitRecord>, std::error_code>
    load_unit(std::string_view unit_id) noexcept = 0;

    // All units of an item, in registration order
    [[nodiscard]] virtual std::expected<std::vector<UnitRecord>, std::error_code>
    load_units(std::string_view item_id) noexcept = 0;

    // Units of an item that are not COMPLETED, in registration order
    [[nodiscard]] virtual std::expected<std::vector<UnitRecord>, std::error_code>
    load_pending_units(std::string_view item_id) noexcept = 0;

    // Items with at least one registered unit
    [[nodiscard]] virtual std::expected<std::vector<std::string>, std::error_code>
    list_items() noexcept = 0;

    [[nodiscard]] virtual std::error_code
    persist_unit_state(std::string_view unit_id, core::UnitState state, std::uint64_t bytes_done) noexcept = 0;

    [[nodiscard]] virtual std::error_code delete_unit_state(std::string_view unit_id) noexcept = 0;

    [[nodiscard]] virtual std::error_code delete_item(std::string_view item_id) noexcept = 0;
};

} // namespace reel::store
