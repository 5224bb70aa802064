// Copyright (c) 2026 changcheng967. All rights reserved.

#include <blobxfer/core/error.hpp>
#include <format>

namespace blobxfer::core {

std::string TransferError::message() const {
    std::string result = code.message();
    if (range) {
        result += std::format(" (bytes {})", range->to_string());
    }
    if (status_code != 0) {
        result += std::format(", HTTP {}", status_code);
    }
    if (cause && cause != code) {
        result += ": ";
        result += cause.message();
    }
    if (!detail.empty()) {
        result += ": ";
        result += detail;
    }
    return result;
}

TransferError probe_error(std::error_code cause,
                          std::int32_t status_code,
                          std::string_view detail) {
    TransferError error;
    error.code = make_error_code(TransferErrc::probe_failed);
    error.cause = cause;
    error.status_code = status_code;
    error.detail = std::string(detail);
    return error;
}

TransferError chunk_fetch_error(const ByteRange& range,
                                std::error_code cause,
                                std::int32_t status_code) {
    TransferError error;
    error.code = make_error_code(TransferErrc::chunk_fetch_failed);
    error.cause = cause;
    error.range = range;
    error.status_code = status_code;
    return error;
}

} // namespace blobxfer::core
