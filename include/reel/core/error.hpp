// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace reel::core {

enum class TransferErrc {
    success = 0,
    network_error,
    timeout,
    refused,
    not_found,
    server_error,
    http_status,
    invalid_url,
    invalid_range,
    size_mismatch,
    cancelled,
    already_running,
    unknown_item,
    item_busy,
    target_conflict,
    corrupt_catalog,
    invalid_config,
    too_many_redirects,
    ssl_error,
    dns_error,
    shutting_down,
};

namespace detail {

struct TransferErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "reel::transfer";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<TransferErrc>(ev)) {
            case TransferErrc::success:              return "Success";
            case TransferErrc::network_error:        return "Network error";
            case TransferErrc::timeout:              return "Operation timed out";
            case TransferErrc::refused:              return "Connection refused";
            case TransferErrc::not_found:            return "Resource not found (404)";
            case TransferErrc::server_error:         return "Server error (5xx)";
            case TransferErrc::http_status:          return "HTTP error status";
            case TransferErrc::invalid_url:          return "Invalid URL";
            case TransferErrc::invalid_range:        return "Invalid byte range";
            case TransferErrc::size_mismatch:        return "Local size does not match remote size";
            case TransferErrc::cancelled:            return "Transfer cancelled";
            case TransferErrc::already_running:      return "Transfer unit is already running";
            case TransferErrc::unknown_item:         return "Unknown item";
            case TransferErrc::item_busy:            return "Item is being deleted";
            case TransferErrc::target_conflict:      return "Target path is owned by another unit";
            case TransferErrc::corrupt_catalog:      return "Catalog file is corrupt";
            case TransferErrc::invalid_config:       return "Invalid configuration";
            case TransferErrc::too_many_redirects:   return "Too many redirects";
            case TransferErrc::ssl_error:            return "SSL/TLS error";
            case TransferErrc::dns_error:            return "DNS resolution failed";
            case TransferErrc::shutting_down:        return "Coordinator is shutting down";
            default:                                 return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::TransferErrcCategory& transfer_errc_category() noexcept {
    static detail::TransferErrcCategory category;
    return category;
}

inline std::error_code make_error_code(TransferErrc e) noexcept {
    return {static_cast<int>(e), transfer_errc_category()};
}

} // namespace reel::core

namespace std {

template<>
struct is_error_code_enum<reel::core::TransferErrc> : true_type {};

} // namespace std
