// Copyright (c) 2026 changcheng967. All rights reserved.

#include <blobxfer/core/content_probe.hpp>
#include <blobxfer/core/byte_range.hpp>
#include <blobxfer/core/logging.hpp>

namespace blobxfer::core {

namespace {

constexpr std::int32_t HTTP_OK = 200;
constexpr std::int32_t HTTP_PARTIAL_CONTENT = 206;
constexpr std::int32_t HTTP_RANGE_NOT_SATISFIABLE = 416;

// "bytes */<total>" as sent with 416 responses
std::optional<std::uint64_t> unsatisfied_range_total(std::string_view value) noexcept {
    constexpr std::string_view prefix = "bytes */";
    if (!value.starts_with(prefix)) {
        return std::nullopt;
    }
    return parse_uint(value.substr(prefix.size()));
}

} // namespace

std::expected<ProbeResult, TransferError>
ContentProbe::probe(const std::string& url, const Headers& headers) noexcept {
    try {
        HttpRequest request{url, with_range(headers, ByteRange{0, 0}.header_value())};

        // Only the headers matter; stop a full 200 body as soon as it starts
        auto response = client_.get(request, [](const char*, std::size_t) { return false; });
        if (!response) {
            logger()->error("Probe of {} failed: {}", url, response.error().message());
            return std::unexpected(probe_error(response.error()));
        }

        const auto status = response->status_code;
        const auto* content_range = response->header("content-range");

        if (status == HTTP_PARTIAL_CONTENT) {
            if (content_range) {
                auto parsed = parse_content_range(*content_range);
                if (parsed && parsed->total) {
                    logger()->debug("Probe of {}: {} bytes, ranges supported", url, *parsed->total);
                    return ProbeResult{*parsed->total, true};
                }
            }
            return std::unexpected(probe_error(make_error_code(TransferErrc::range_mismatch), status,
                                               "206 response without a usable Content-Range"));
        }

        if (status == HTTP_RANGE_NOT_SATISFIABLE && content_range) {
            if (auto total = unsatisfied_range_total(*content_range); total && *total == 0) {
                logger()->debug("Probe of {}: empty object", url);
                return ProbeResult{0, true};
            }
        }

        if (status == HTTP_OK) {
            if (response->content_length) {
                logger()->debug("Probe of {}: {} bytes, no range support", url, *response->content_length);
                return ProbeResult{*response->content_length, false};
            }
            return std::unexpected(probe_error(make_error_code(TransferErrc::probe_failed), status,
                                               "200 response without Content-Length"));
        }

        return std::unexpected(probe_error(make_error_code(TransferErrc::unexpected_status), status));
    } catch (const std::exception& e) {
        return std::unexpected(probe_error(make_error_code(TransferErrc::network_error), 0, e.what()));
    }
}

} // namespace blobxfer::core
