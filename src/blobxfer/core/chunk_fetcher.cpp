// Copyright (c) 2026 changcheng967. All rights reserved.

#include <blobxfer/core/chunk_fetcher.hpp>
#include <blobxfer/core/logging.hpp>
#include <vector>

namespace blobxfer::core {

namespace {

constexpr std::int32_t HTTP_OK = 200;
constexpr std::int32_t HTTP_PARTIAL_CONTENT = 206;

TransferError fetch_error(const ByteRange& range, TransferErrc cause, std::int32_t status = 0) {
    return chunk_fetch_error(range, make_error_code(cause), status);
}

} // namespace

std::expected<void, TransferError>
ChunkFetcher::fetch(const std::string& url, const Headers& headers, const ByteRange& range) noexcept {
    try {
        std::vector<char> buffer;
        buffer.reserve(static_cast<std::size_t>(range.size()));
        bool overflow = false;

        HttpRequest request{url, with_range(headers, range.header_value())};
        auto response = client_.get(request, [&](const char* data, std::size_t size) {
            if (buffer.size() + size > range.size()) {
                overflow = true;
                return false;
            }
            buffer.insert(buffer.end(), data, data + size);
            return true;
        });

        if (!response) {
            logger()->error("Chunk {} of {} failed: {}", range.to_string(), url, response.error().message());
            return std::unexpected(chunk_fetch_error(range, response.error()));
        }

        if (response->status_code != HTTP_PARTIAL_CONTENT) {
            logger()->error("Chunk {} of {}: unexpected HTTP {}", range.to_string(), url, response->status_code);
            return std::unexpected(fetch_error(range, TransferErrc::unexpected_status, response->status_code));
        }

        if (const auto* value = response->header("content-range")) {
            auto parsed = parse_content_range(*value);
            if (!parsed || parsed->range != range) {
                logger()->error("Chunk {} of {}: server answered with Content-Range '{}'",
                                range.to_string(), url, *value);
                return std::unexpected(fetch_error(range, TransferErrc::range_mismatch, response->status_code));
            }
        }

        if (overflow || buffer.size() != range.size()) {
            logger()->error("Chunk {} of {}: got {} bytes, expected {}",
                            range.to_string(), url, buffer.size(), range.size());
            return std::unexpected(fetch_error(range, TransferErrc::short_body, response->status_code));
        }

        std::lock_guard<std::mutex> guard(lock_);
        if (auto ec = destination_.seek(range.start)) {
            return std::unexpected(chunk_fetch_error(range, ec));
        }
        if (auto ec = destination_.write(buffer.data(), buffer.size())) {
            return std::unexpected(chunk_fetch_error(range, ec));
        }
        if (auto ec = destination_.flush()) {
            return std::unexpected(chunk_fetch_error(range, ec));
        }
        return {};
    } catch (const std::exception& e) {
        logger()->error("Chunk {} of {} raised: {}", range.to_string(), url, e.what());
        return std::unexpected(fetch_error(range, TransferErrc::network_error));
    }
}

std::expected<std::uint64_t, TransferError>
ChunkFetcher::fetch_whole(const std::string& url, const Headers& headers) noexcept {
    try {
        Headers plain;
        for (const auto& [name, value] : headers) {
            if (to_lower(name) != "range") {
                plain.emplace(name, value);
            }
        }

        // Held for the whole body: nothing else writes in this mode
        std::lock_guard<std::mutex> guard(lock_);

        std::uint64_t written = 0;
        std::error_code write_ec = destination_.seek(0);
        if (write_ec) {
            return std::unexpected(chunk_fetch_error(ByteRange{0, 0}, write_ec));
        }

        auto response = client_.get(HttpRequest{url, std::move(plain)}, [&](const char* data, std::size_t size) {
            write_ec = destination_.write(data, size);
            if (write_ec) {
                return false;
            }
            written += size;
            return true;
        });

        const ByteRange whole{0, written == 0 ? 0 : written - 1};

        if (!response) {
            logger()->error("Download of {} failed: {}", url, response.error().message());
            return std::unexpected(chunk_fetch_error(whole, response.error()));
        }
        if (write_ec) {
            return std::unexpected(chunk_fetch_error(whole, write_ec, response->status_code));
        }
        if (response->status_code != HTTP_OK) {
            logger()->error("Download of {}: unexpected HTTP {}", url, response->status_code);
            return std::unexpected(fetch_error(whole, TransferErrc::unexpected_status, response->status_code));
        }
        if (response->content_length && *response->content_length != written) {
            logger()->error("Download of {}: got {} bytes, expected {}", url, written, *response->content_length);
            return std::unexpected(fetch_error(whole, TransferErrc::short_body, response->status_code));
        }
        if (auto ec = destination_.flush()) {
            return std::unexpected(chunk_fetch_error(whole, ec));
        }
        return written;
    } catch (const std::exception& e) {
        logger()->error("Download of {} raised: {}", url, e.what());
        return std::unexpected(fetch_error(ByteRange{0, 0}, TransferErrc::network_error));
    }
}

} // namespace blobxfer::core
