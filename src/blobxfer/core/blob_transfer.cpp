// Copyright (c) 2026 changcheng967. All rights reserved.

#include <blobxfer/core/blob_transfer.hpp>
#include <blobxfer/core/chunk_fetcher.hpp>
#include <blobxfer/core/logging.hpp>
#include <algorithm>
#include <thread>
#include <variant>

namespace blobxfer::core {

namespace {

TransferError invalid_request(std::string_view detail) {
    TransferError error;
    error.code = make_error_code(TransferErrc::invalid_request);
    error.detail = std::string(detail);
    return error;
}

TransferError destination_error(std::error_code cause) {
    TransferError error;
    error.code = make_error_code(TransferErrc::destination_error);
    error.cause = cause;
    return error;
}

std::expected<void, TransferError> validate(const TransferRequest& request) {
    if (request.url.empty()) {
        return std::unexpected(invalid_request("url is empty"));
    }
    if (!request.destination) {
        return std::unexpected(invalid_request("destination is not set"));
    }
    if (request.chunk_size == 0) {
        return std::unexpected(invalid_request("chunk_size must be positive"));
    }
    if (request.max_workers == 0) {
        return std::unexpected(invalid_request("max_workers must be positive"));
    }
    if (request.resume && request.resume_state_path.empty()) {
        return std::unexpected(invalid_request("resume requires resume_state_path"));
    }
    return {};
}

} // namespace

std::string_view to_string(TransferPhase phase) noexcept {
    switch (phase) {
        case TransferPhase::not_started: return "not_started";
        case TransferPhase::probing:     return "probing";
        case TransferPhase::fresh:       return "fresh";
        case TransferPhase::resuming:    return "resuming";
        case TransferPhase::downloading: return "downloading";
        case TransferPhase::completed:   return "completed";
        case TransferPhase::failed:      return "failed";
        default:                         return "unknown";
    }
}

std::uint64_t BlobTransfer::adaptive_chunk_size(std::uint64_t requested,
                                                std::uint64_t content_size) noexcept {
    if (content_size < SMALL_OBJECT_SIZE) {
        return std::min(requested, std::max(MIN_ADAPTIVE_CHUNK, content_size / 4));
    }
    if (content_size > LARGE_OBJECT_SIZE) {
        return std::max(requested, std::min(MAX_ADAPTIVE_CHUNK, content_size / 10));
    }
    return requested;
}

//=============================================================================
// run
//=============================================================================

std::expected<TransferResult, TransferError>
BlobTransfer::run(const TransferRequest& request) noexcept {
    phase_.store(TransferPhase::not_started, std::memory_order_release);

    if (auto valid = validate(request); !valid) {
        fail();
        return std::unexpected(valid.error());
    }

    phase_.store(TransferPhase::probing, std::memory_order_release);

    ContentProbe probe(client_);
    auto probed = probe.probe(request.url, request.headers);
    if (!probed) {
        fail();
        return std::unexpected(probed.error());
    }

    if (!probed->supports_ranges) {
        logger()->info("Server does not support range requests for {}, falling back to a single download",
                       request.url);
        return run_unranged(request, probed->content_size);
    }

    try {
        return run_ranged(request, probed->content_size);
    } catch (const std::exception& e) {
        // Thread creation or allocation failure
        logger()->error("Transfer of {} aborted: {}", request.url, e.what());
        fail();
        TransferError error;
        error.code = make_error_code(TransferErrc::aborted);
        error.detail = e.what();
        return std::unexpected(std::move(error));
    }
}

std::expected<TransferResult, TransferError>
BlobTransfer::run_unranged(const TransferRequest& request, std::uint64_t content_size) noexcept {
    phase_.store(TransferPhase::downloading, std::memory_order_release);

    ChunkFetcher fetcher(client_, *request.destination, io_mutex_);
    auto written = fetcher.fetch_whole(request.url, request.headers);
    if (!written) {
        fail();
        return std::unexpected(written.error());
    }

    if (auto done = finalize(request, *written); !done) {
        fail();
        return std::unexpected(done.error());
    }

    if (*written != content_size) {
        logger()->warn("Probe of {} announced {} bytes, download produced {}", request.url, content_size, *written);
    }

    TransferResult result;
    result.content_size = *written;
    result.ranged = false;
    result.chunk_size = *written;
    result.total_chunks = 1;
    result.fetched_chunks = 1;
    result.fetched_bytes = *written;
    result.workers = 1;

    if (request.on_progress) {
        try {
            request.on_progress(TransferProgress{*written, *written, 0, 1, 1, 100.0});
        } catch (const std::exception& e) {
            logger()->warn("Progress callback for {} raised: {}", request.url, e.what());
        }
    }

    phase_.store(TransferPhase::completed, std::memory_order_release);
    logger()->info("Downloaded {} ({} bytes, sequential)", request.url, *written);
    return result;
}

std::expected<TransferResult, TransferError>
BlobTransfer::run_ranged(const TransferRequest& request, std::uint64_t content_size) {
    const std::uint64_t chunk_size = request.adaptive_chunk_size
        ? adaptive_chunk_size(request.chunk_size, content_size)
        : request.chunk_size;

    std::vector<ByteRange> plan;
    if (content_size > 0) {
        plan = split_range(0, content_size - 1, chunk_size);
    }

    RunContext ctx;
    ctx.request = &request;
    ctx.total_chunks = static_cast<std::uint32_t>(plan.size());
    ctx.state = initial_state(request, content_size, plan);
    ctx.resumed_bytes = ctx.state.completed_bytes();

    const auto resumed_chunks = static_cast<std::uint32_t>(ctx.state.completed_chunks.size());
    for (const auto& range : plan) {
        if (!ctx.state.completed_chunks.contains(range)) {
            ctx.pending.push_back(range);
        }
    }

    const auto workers = static_cast<std::uint32_t>(
        std::min<std::size_t>(request.max_workers, ctx.pending.size()));

    logger()->debug("Transfer of {}: {} bytes in {} chunks of {}, {} pending, {} workers",
                    request.url, content_size, plan.size(), chunk_size, ctx.pending.size(), workers);

    phase_.store(TransferPhase::downloading, std::memory_order_release);

    {
        std::vector<std::jthread> pool;
        pool.reserve(workers);
        for (std::uint32_t i = 0; i < workers; ++i) {
            pool.emplace_back([this, &ctx] { worker(ctx); });
        }
        // Joined here: in-flight chunks finish before we look at the outcome
    }

    if (ctx.error) {
        if (request.resume) {
            persist(ctx);
            logger()->info("Saved progress of {}: {} of {} chunks", request.url,
                           ctx.state.completed_chunks.size(), ctx.total_chunks);
        }
        fail();
        return std::unexpected(std::move(*ctx.error));
    }

    if (auto done = finalize(request, content_size); !done) {
        if (request.resume) {
            persist(ctx);
        }
        fail();
        return std::unexpected(done.error());
    }

    TransferResult result;
    result.content_size = content_size;
    result.ranged = true;
    result.chunk_size = chunk_size;
    result.total_chunks = ctx.total_chunks;
    result.fetched_chunks = ctx.fetched_chunks;
    result.fetched_bytes = ctx.fetched_bytes;
    result.resumed_chunks = resumed_chunks;
    result.resumed_bytes = ctx.resumed_bytes;
    result.workers = workers;

    phase_.store(TransferPhase::completed, std::memory_order_release);
    logger()->info("Downloaded {} ({} bytes, {} chunks fetched, {} resumed)",
                   request.url, content_size, result.fetched_chunks, result.resumed_chunks);
    return result;
}

TransferState BlobTransfer::initial_state(const TransferRequest& request,
                                          std::uint64_t content_size,
                                          const std::vector<ByteRange>& plan) {
    TransferState fresh;
    fresh.url = request.url;
    fresh.content_size = content_size;
    fresh.touch();

    if (!request.resume) {
        phase_.store(TransferPhase::fresh, std::memory_order_release);
        return fresh;
    }

    auto loaded = ResumeStateStore::load(request.resume_state_path);

    if (auto* start = std::get_if<FreshStart>(&loaded)) {
        logger()->debug("Starting {} from scratch: {}", request.url, start->reason);
        phase_.store(TransferPhase::fresh, std::memory_order_release);
        return fresh;
    }

    auto& previous = std::get<Resumed>(loaded).state;
    if (!ResumeStateStore::matches(previous, request.url, content_size)) {
        logger()->warn("Discarding resume state {}: it describes {} ({} bytes), now {} ({} bytes)",
                       request.resume_state_path.string(), previous.url, previous.content_size,
                       request.url, content_size);
        phase_.store(TransferPhase::fresh, std::memory_order_release);
        return fresh;
    }

    // Only chunks of the current plan count; a different chunk size
    // leaves nothing reusable
    for (const auto& range : plan) {
        if (previous.completed_chunks.contains(range)) {
            fresh.completed_chunks.insert(range);
        }
    }

    logger()->info("Resuming {}: {} of {} chunks already downloaded",
                   request.url, fresh.completed_chunks.size(), plan.size());
    phase_.store(TransferPhase::resuming, std::memory_order_release);
    return fresh;
}

//=============================================================================
// Worker pool
//=============================================================================

void BlobTransfer::worker(RunContext& ctx) {
    const auto& request = *ctx.request;
    ChunkFetcher fetcher(client_, *request.destination, io_mutex_);

    while (!ctx.failed.load(std::memory_order_acquire)) {
        const auto index = ctx.next.fetch_add(1, std::memory_order_relaxed);
        if (index >= ctx.pending.size()) {
            return;
        }

        const auto& range = ctx.pending[index];
        auto fetched = fetcher.fetch(request.url, request.headers, range);
        if (!fetched) {
            fail_run(ctx, std::move(fetched.error()));
            return;
        }

        try {
            record_completion(ctx, range);
        } catch (const std::exception& e) {
            TransferError error = chunk_fetch_error(range, make_error_code(TransferErrc::aborted));
            error.detail = e.what();
            fail_run(ctx, std::move(error));
            return;
        }
    }
}

void BlobTransfer::fail_run(RunContext& ctx, TransferError error) noexcept {
    {
        std::lock_guard<std::mutex> lock(ctx.state_mutex);
        if (!ctx.error) {
            ctx.error = std::move(error);
        }
    }
    // Workers finish their current chunk and take no new one
    ctx.failed.store(true, std::memory_order_release);
}

void BlobTransfer::record_completion(RunContext& ctx, const ByteRange& range) {
    const auto& request = *ctx.request;
    TransferProgress snapshot;
    {
        std::lock_guard<std::mutex> lock(ctx.state_mutex);
        ctx.state.completed_chunks.insert(range);
        ctx.state.touch();
        ++ctx.fetched_chunks;
        ctx.fetched_bytes += range.size();

        if (request.resume) {
            persist(ctx);
        }

        snapshot.total_bytes = ctx.state.content_size;
        snapshot.completed_bytes = ctx.resumed_bytes + ctx.fetched_bytes;
        snapshot.resumed_bytes = ctx.resumed_bytes;
        snapshot.completed_chunks = static_cast<std::uint32_t>(ctx.state.completed_chunks.size());
        snapshot.total_chunks = ctx.total_chunks;
        snapshot.percent = snapshot.total_bytes > 0
            ? static_cast<double>(snapshot.completed_bytes) * 100.0 / static_cast<double>(snapshot.total_bytes)
            : 100.0;
    }

    if (request.on_progress) {
        try {
            request.on_progress(snapshot);
        } catch (const std::exception& e) {
            logger()->warn("Progress callback for {} raised: {}", request.url, e.what());
        }
    }
}

void BlobTransfer::persist(const RunContext& ctx) const noexcept {
    const auto& path = ctx.request->resume_state_path;
    if (auto ec = ResumeStateStore::save(path, ctx.state)) {
        logger()->warn("Could not save resume state {}: {}", path.string(), ec.message());
    }
}

std::expected<void, TransferError>
BlobTransfer::finalize(const TransferRequest& request, std::uint64_t content_size) noexcept {
    {
        std::lock_guard<std::mutex> lock(io_mutex_);
        if (auto ec = request.destination->set_size(content_size)) {
            return std::unexpected(destination_error(ec));
        }
    }

    if (!request.resume_state_path.empty()) {
        if (auto ec = ResumeStateStore::clear(request.resume_state_path)) {
            logger()->warn("Could not remove resume state {}: {}",
                           request.resume_state_path.string(), ec.message());
        }
    }
    return {};
}

//=============================================================================
// stream
//=============================================================================

std::expected<std::uint64_t, TransferError>
BlobTransfer::stream(const std::string& url, const Headers& headers, disk::Destination& destination) noexcept {
    phase_.store(TransferPhase::downloading, std::memory_order_release);

    ChunkFetcher fetcher(client_, destination, io_mutex_);
    auto written = fetcher.fetch_whole(url, headers);
    if (!written) {
        fail();
        return std::unexpected(written.error());
    }

    phase_.store(TransferPhase::completed, std::memory_order_release);
    return *written;
}

} // namespace blobxfer::core
