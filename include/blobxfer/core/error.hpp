// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <blobxfer/core/byte_range.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace blobxfer::core {

enum class TransferErrc {
    success = 0,
    probe_failed,
    chunk_fetch_failed,
    unexpected_status,
    short_body,
    range_mismatch,
    network_error,
    timeout,
    ssl_error,
    dns_error,
    too_many_redirects,
    invalid_request,
    invalid_url,
    destination_error,
    aborted,
};

namespace detail {

struct TransferErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "blobxfer::transfer";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<TransferErrc>(ev)) {
            case TransferErrc::success:            return "Success";
            case TransferErrc::probe_failed:       return "Content size could not be determined";
            case TransferErrc::chunk_fetch_failed: return "Chunk fetch failed";
            case TransferErrc::unexpected_status:  return "Unexpected HTTP status";
            case TransferErrc::short_body:         return "Response body length does not match the requested range";
            case TransferErrc::range_mismatch:     return "Content-Range does not match the requested range";
            case TransferErrc::network_error:      return "Network error";
            case TransferErrc::timeout:            return "Operation timed out";
            case TransferErrc::ssl_error:          return "SSL/TLS error";
            case TransferErrc::dns_error:          return "DNS resolution failed";
            case TransferErrc::too_many_redirects: return "Too many redirects";
            case TransferErrc::invalid_request:    return "Invalid transfer request";
            case TransferErrc::invalid_url:        return "Invalid URL";
            case TransferErrc::destination_error:  return "Destination could not be finalized";
            case TransferErrc::aborted:            return "Transfer aborted";
            default:                               return "Unknown error";
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

// Error value returned by every fallible engine operation.
//   code   - what went wrong at the engine level (probe_failed, chunk_fetch_failed, ...)
//   cause  - the underlying transport or disk error, if any
//   range  - the chunk being fetched when the failure happened
struct TransferError {
    std::error_code code;
    std::error_code cause;
    std::optional<ByteRange> range;
    std::int32_t status_code{0};
    std::string detail;

    [[nodiscard]] std::string message() const;
};

[[nodiscard]] TransferError probe_error(std::error_code cause,
                                        std::int32_t status_code = 0,
                                        std::string_view detail = {});

[[nodiscard]] TransferError chunk_fetch_error(const ByteRange& range,
                                              std::error_code cause,
                                              std::int32_t status_code = 0);

} // namespace blobxfer::core

namespace std {

template<>
struct is_error_code_enum<blobxfer::core::TransferErrc> : true_type {};

} // namespace std
