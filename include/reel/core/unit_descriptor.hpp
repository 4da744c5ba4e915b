// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/error.hpp>
#include <nlohmann/json_fwd.hpp>
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

namespace reel::core {

// Serializable identity of a transfer unit. Two descriptors are the same
// logical unit when url and target path match.
struct UnitDescriptor {
    std::string id;            // md5(absolute target path), lowercase hex
    std::string url;
    std::string target_path;   // Absolute, lexically normal
    std::string item_id;
    std::string track_ref;

    // Validate the URL, normalize the target path and derive the id
    [[nodiscard]] static std::expected<UnitDescriptor, std::error_code>
    make(std::string_view url, std::string_view target_path,
         std::string_view item_id = {}, std::string_view track_ref = {}) noexcept;

    [[nodiscard]] std::string serialize() const;

    [[nodiscard]] static std::expected<UnitDescriptor, std::error_code>
    deserialize(std::string_view json) noexcept;

    friend bool operator==(const UnitDescriptor& a, const UnitDescriptor& b) noexcept {
        return a.url == b.url && a.target_path == b.target_path;
    }
};

struct UnitDescriptorHash {
    [[nodiscard]] std::size_t operator()(const UnitDescriptor& d) const noexcept;
};

// Content-addressed unit id for a target path
[[nodiscard]] std::string make_unit_id(std::string_view target_path);

// nlohmann::json conversions (keys: id, url, targetFile, itemId, trackRelativeId)
void to_json(nlohmann::json& j, const UnitDescriptor& d);
void from_json(const nlohmann::json& j, UnitDescriptor& d);

} // namespace reel::core
