// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <blobxfer/core/byte_range.hpp>
#include <blobxfer/core/error.hpp>
#include <blobxfer/core/http_client.hpp>
#include <blobxfer/disk/destination.hpp>
#include <cstdint>
#include <expected>
#include <mutex>
#include <string>

namespace blobxfer::core {

// Downloads byte ranges into a destination shared between workers.
// `lock` guards the destination cursor: every seek + write pair runs
// under it. Chunks own disjoint offsets, so the lock orders cursor use,
// not data.
class ChunkFetcher {
public:
    ChunkFetcher(HttpClient& client, disk::Destination& destination, std::mutex& lock) noexcept
        : client_(client), destination_(destination), lock_(lock) {}

    // GET `range`, buffer the whole body, then seek to range.start and
    // write it in one critical section. Nothing is written unless the
    // full chunk arrived with status 206.
    [[nodiscard]] std::expected<void, TransferError>
    fetch(const std::string& url, const Headers& headers, const ByteRange& range) noexcept;

    // Plain GET (no Range) streamed into the destination from offset 0.
    // Used when the server ignores range requests. Returns bytes written.
    [[nodiscard]] std::expected<std::uint64_t, TransferError>
    fetch_whole(const std::string& url, const Headers& headers) noexcept;

private:
    HttpClient& client_;
    disk::Destination& destination_;
    std::mutex& lock_;
};

} // namespace blobxfer::core
