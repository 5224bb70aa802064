// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <blobxfer/core/error.hpp>
#include <blobxfer/core/http_client.hpp>
#include <cstdint>
#include <expected>
#include <string>

namespace blobxfer::core {

struct ProbeResult {
    std::uint64_t content_size{0};
    bool supports_ranges{false};
};

// Discovers the object size and range support with a "Range: bytes=0-0" GET.
//   206 + Content-Range: bytes 0-0/<total>  -> total, ranges supported
//   416 + Content-Range: bytes */0          -> empty object
//   200 + Content-Length                    -> length, no range support
// Anything else is a probe_failed error.
class ContentProbe {
public:
    explicit ContentProbe(HttpClient& client) noexcept : client_(client) {}

    [[nodiscard]] std::expected<ProbeResult, TransferError>
    probe(const std::string& url, const Headers& headers) noexcept;

private:
    HttpClient& client_;
};

} // namespace blobxfer::core
