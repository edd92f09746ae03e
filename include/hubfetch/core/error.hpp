// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string_view>

namespace hubfetch::core {

enum class TransferErrc {
    success = 0,
    network_error,       // Connection reset, refused, DNS, TLS
    timeout,             // Request exceeded its timeout
    server_error,        // 5xx
    rate_limited,        // 429
    short_body,          // Response ended before the requested length
    not_found,           // 404
    permission_denied,   // 401/403
    client_error,        // Other 4xx
    invalid_range,       // 416 or body longer than requested
    integrity_mismatch,  // Digest of assembled file differs from expected
    invalid_config,
    invalid_size,
    chunk_failed,        // A chunk exhausted its attempts
    cancelled,
    metadata_error,      // Hub answered with something we cannot interpret
    ledger_corrupt,
};

namespace detail {

struct TransferErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "hubfetch::transfer";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<TransferErrc>(ev)) {
            case TransferErrc::success:             return "Success";
            case TransferErrc::network_error:       return "Network error";
            case TransferErrc::timeout:             return "Request timed out";
            case TransferErrc::server_error:        return "Server error (5xx)";
            case TransferErrc::rate_limited:        return "Rate limited (429)";
            case TransferErrc::short_body:          return "Response body shorter than requested range";
            case TransferErrc::not_found:           return "Repository or file not found (404)";
            case TransferErrc::permission_denied:   return "Access denied (401/403)";
            case TransferErrc::client_error:        return "Client error (4xx)";
            case TransferErrc::invalid_range:       return "Invalid byte range";
            case TransferErrc::integrity_mismatch:  return "Digest mismatch";
            case TransferErrc::invalid_config:      return "Invalid configuration";
            case TransferErrc::invalid_size:        return "Invalid size";
            case TransferErrc::chunk_failed:        return "Chunk failed after retries";
            case TransferErrc::cancelled:           return "Transfer cancelled";
            case TransferErrc::metadata_error:      return "Malformed hub metadata";
            case TransferErrc::ledger_corrupt:      return "Resume ledger corrupt";
            default:                                return "Unknown error";
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

// Failures worth another attempt after a backoff
[[nodiscard]] inline bool is_transient(const std::error_code& ec) noexcept {
    if (ec.category() != transfer_errc_category()) return false;
    switch (static_cast<TransferErrc>(ec.value())) {
        case TransferErrc::network_error:
        case TransferErrc::timeout:
        case TransferErrc::server_error:
        case TransferErrc::rate_limited:
        case TransferErrc::short_body:
            return true;
        default:
            return false;
    }
}

// Map an HTTP status (>= 400) to its transfer error
[[nodiscard]] inline std::error_code error_from_http_status(long status) noexcept {
    if (status == 404) return make_error_code(TransferErrc::not_found);
    if (status == 401 || status == 403) return make_error_code(TransferErrc::permission_denied);
    if (status == 416) return make_error_code(TransferErrc::invalid_range);
    if (status == 429) return make_error_code(TransferErrc::rate_limited);
    if (status >= 500) return make_error_code(TransferErrc::server_error);
    if (status >= 400) return make_error_code(TransferErrc::client_error);
    return {};
}

} // namespace hubfetch::core

namespace std {

template<>
struct is_error_code_enum<hubfetch::core::TransferErrc> : true_type {};

} // namespace std
