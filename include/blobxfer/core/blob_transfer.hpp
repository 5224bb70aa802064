// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <blobxfer/core/byte_range.hpp>
#include <blobxfer/core/config.hpp>
#include <blobxfer/core/content_probe.hpp>
#include <blobxfer/core/error.hpp>
#include <blobxfer/core/http_client.hpp>
#include <blobxfer/core/resume_state.hpp>
#include <blobxfer/disk/destination.hpp>
#include <atomic>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace blobxfer::core {

// Transfer state machine:
//   not_started -> probing -> {fresh | resuming} -> downloading -> {completed | failed}
enum class TransferPhase : std::uint8_t {
    not_started,
    probing,
    fresh,        // No usable resume state, full chunk plan pending
    resuming,     // Completed chunks from a previous run are skipped
    downloading,
    completed,
    failed
};

[[nodiscard]] std::string_view to_string(TransferPhase phase) noexcept;

// Progress snapshot, reported after every chunk written
struct TransferProgress {
    std::uint64_t total_bytes{0};
    std::uint64_t completed_bytes{0};     // Includes resumed bytes
    std::uint64_t resumed_bytes{0};
    std::uint32_t completed_chunks{0};
    std::uint32_t total_chunks{0};
    double percent{0.0};
};

using ProgressCallback = std::function<void(const TransferProgress&)>;

struct TransferRequest {
    std::string url;
    Headers headers;                          // Sent with every request, e.g. Authorization
    disk::Destination* destination{nullptr};  // Not owned
    std::uint64_t chunk_size{DEFAULT_CHUNK_SIZE};
    std::uint32_t max_workers{DEFAULT_MAX_WORKERS};
    bool resume{false};
    std::filesystem::path resume_state_path;  // Required when resume is true
    bool adaptive_chunk_size{false};          // Derive chunk size from the object size
    ProgressCallback on_progress;
};

struct TransferResult {
    std::uint64_t content_size{0};
    bool ranged{false};                // False when the server ignored range requests
    std::uint64_t chunk_size{0};       // Effective chunk size
    std::uint32_t total_chunks{0};
    std::uint32_t fetched_chunks{0};   // Fetched by this run
    std::uint64_t fetched_bytes{0};
    std::uint32_t resumed_chunks{0};   // Skipped thanks to resume state
    std::uint64_t resumed_bytes{0};
    std::uint32_t workers{0};
};

// Resumable, parallel, range-based blob download.
//
// run() probes the object, splits [0, size - 1] into chunks, drops the
// chunks a matching resume state already covers, and fetches the rest
// with a pool of max_workers threads. Each finished chunk is recorded
// (and persisted when resuming). The first chunk failure stops the pool
// from taking new chunks; progress is saved and the error returned.
// On success the resume state file is removed.
class BlobTransfer {
public:
    explicit BlobTransfer(HttpClient& client) noexcept : client_(client) {}

    // Non-copyable, non-movable (atomic members can't be moved)
    BlobTransfer(const BlobTransfer&) = delete;
    BlobTransfer& operator=(const BlobTransfer&) = delete;

    [[nodiscard]] std::expected<TransferResult, TransferError>
    run(const TransferRequest& request) noexcept;

    // Sequential GET without chunking or resume; returns bytes written
    [[nodiscard]] std::expected<std::uint64_t, TransferError>
    stream(const std::string& url, const Headers& headers, disk::Destination& destination) noexcept;

    [[nodiscard]] TransferPhase phase() const noexcept { return phase_.load(std::memory_order_acquire); }

    // Chunk size used when adaptive sizing is on:
    //   < 10 MiB  -> min(requested, max(1 MiB, size / 4))
    //   > 100 MiB -> max(requested, min(32 MiB, size / 10))
    [[nodiscard]] static std::uint64_t adaptive_chunk_size(std::uint64_t requested,
                                                           std::uint64_t content_size) noexcept;

private:
    // Shared by the workers of one run
    struct RunContext {
        const TransferRequest* request{nullptr};
        std::vector<ByteRange> pending;
        std::atomic<std::size_t> next{0};
        std::atomic<bool> failed{false};

        std::mutex state_mutex;      // Guards everything below
        TransferState state;
        std::uint32_t total_chunks{0};
        std::uint64_t resumed_bytes{0};
        std::uint32_t fetched_chunks{0};
        std::uint64_t fetched_bytes{0};
        std::optional<TransferError> error;
    };

    [[nodiscard]] std::expected<TransferResult, TransferError>
    run_unranged(const TransferRequest& request, std::uint64_t content_size) noexcept;

    [[nodiscard]] std::expected<TransferResult, TransferError>
    run_ranged(const TransferRequest& request, std::uint64_t content_size);

    // Turn a loaded state into the starting state for this run
    [[nodiscard]] TransferState initial_state(const TransferRequest& request,
                                              std::uint64_t content_size,
                                              const std::vector<ByteRange>& plan);

    void worker(RunContext& ctx);
    void record_completion(RunContext& ctx, const ByteRange& range);
    void fail_run(RunContext& ctx, TransferError error) noexcept;
    void persist(const RunContext& ctx) const noexcept;

    [[nodiscard]] std::expected<void, TransferError>
    finalize(const TransferRequest& request, std::uint64_t content_size) noexcept;

    void fail() noexcept { phase_.store(TransferPhase::failed, std::memory_order_release); }

    HttpClient& client_;
    std::mutex io_mutex_;   // Destination cursor: every seek + write pair
    std::atomic<TransferPhase> phase_{TransferPhase::not_started};
};

} // namespace blobxfer::core
