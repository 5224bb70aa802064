// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <blobxfer/core/blob_transfer.hpp>
#include <blobxfer/disk/destination.hpp>
#include <blobxfer/disk/file_destination.hpp>
#include "fake_blob_server.hpp"
#include "temp_dir.hpp"
#include <set>

using namespace blobxfer::core;
using blobxfer::disk::FileDestination;
using blobxfer::disk::MemoryDestination;
using blobxfer::disk::OpenMode;
using blobxfer::test::FakeBlobServer;
using blobxfer::test::TempDir;
using blobxfer::test::make_blob;
using blobxfer::test::read_text;
using blobxfer::test::to_string;
using blobxfer::test::write_text;

namespace {

constexpr const char* URL = "https://example.com/datasets/blob.bin";

TransferRequest make_request(blobxfer::disk::Destination& destination,
                             std::uint64_t chunk_size,
                             std::uint32_t workers) {
    TransferRequest request;
    request.url = URL;
    request.destination = &destination;
    request.chunk_size = chunk_size;
    request.max_workers = workers;
    return request;
}

std::set<ByteRange> loaded_chunks(const std::filesystem::path& path) {
    auto loaded = ResumeStateStore::load(path);
    REQUIRE(std::holds_alternative<Resumed>(loaded));
    return std::get<Resumed>(loaded).state.completed_chunks;
}

} // namespace

TEST_CASE("BlobTransfer downloads a ranged object", "[blob_transfer]") {
    const auto blob = make_blob(800);
    FakeBlobServer server(blob);
    MemoryDestination destination;
    BlobTransfer transfer(server);

    auto result = transfer.run(make_request(destination, 100, 3));
    REQUIRE(result);

    CHECK(to_string(destination.data()) == blob);
    CHECK(result->content_size == 800);
    CHECK(result->ranged);
    CHECK(result->chunk_size == 100);
    CHECK(result->total_chunks == 8);
    CHECK(result->fetched_chunks == 8);
    CHECK(result->fetched_bytes == 800);
    CHECK(result->resumed_chunks == 0);
    CHECK(result->workers == 3);
    CHECK(transfer.phase() == TransferPhase::completed);

    auto served = server.served_chunks();
    CHECK(served == split_range(0, 799, 100));
}

TEST_CASE("BlobTransfer is independent of worker count", "[blob_transfer]") {
    // 8 chunks of 100 bytes
    const auto blob = make_blob(800);

    MemoryDestination parallel;
    {
        FakeBlobServer server(blob);
        BlobTransfer transfer(server);
        auto result = transfer.run(make_request(parallel, 100, 8));
        REQUIRE(result);
        CHECK(result->workers == 8);
    }

    MemoryDestination serial;
    {
        FakeBlobServer server(blob);
        BlobTransfer transfer(server);
        auto result = transfer.run(make_request(serial, 100, 1));
        REQUIRE(result);
        CHECK(result->workers == 1);
    }

    CHECK(parallel.data() == serial.data());
    CHECK(to_string(parallel.data()) == blob);
}

TEST_CASE("BlobTransfer clamps workers to the pending chunks", "[blob_transfer]") {
    const auto blob = make_blob(250);
    FakeBlobServer server(blob);
    MemoryDestination destination;
    BlobTransfer transfer(server);

    auto result = transfer.run(make_request(destination, 100, 16));
    REQUIRE(result);
    CHECK(result->total_chunks == 2);
    CHECK(result->workers == 2);
    CHECK(to_string(destination.data()) == blob);
}

TEST_CASE("BlobTransfer resumes an interrupted download", "[blob_transfer]") {
    TempDir dir;
    const auto output = dir / "blob.bin";
    const auto state_path = ResumeStateStore::sidecar_path(output);
    const auto blob = make_blob(1000);
    const auto plan = split_range(0, 999, 100);
    REQUIRE(plan.size() == 10);

    // First run dies on the fifth chunk after four were written
    {
        FakeBlobServer server(blob);
        server.fail({plan[4], 503});

        auto destination = FileDestination::open(output.string(), OpenMode::truncate);
        REQUIRE(destination);

        auto request = make_request(*destination, 100, 1);
        request.resume = true;
        request.resume_state_path = state_path;

        BlobTransfer transfer(server);
        auto result = transfer.run(request);
        REQUIRE_FALSE(result);
        CHECK(result.error().code == TransferErrc::chunk_fetch_failed);
        CHECK(result.error().status_code == 503);
        REQUIRE(result.error().range);
        CHECK(*result.error().range == plan[4]);
        CHECK(transfer.phase() == TransferPhase::failed);
    }

    REQUIRE(ResumeStateStore::exists(state_path));
    CHECK(loaded_chunks(state_path) == std::set<ByteRange>(plan.begin(), plan.begin() + 4));

    // Second run only asks for the remaining six chunks
    FakeBlobServer server(blob);
    {
        auto destination = FileDestination::open(output.string(), OpenMode::keep);
        REQUIRE(destination);

        auto request = make_request(*destination, 100, 3);
        request.resume = true;
        request.resume_state_path = state_path;

        BlobTransfer transfer(server);
        auto result = transfer.run(request);
        REQUIRE(result);
        CHECK(result->resumed_chunks == 4);
        CHECK(result->resumed_bytes == 400);
        CHECK(result->fetched_chunks == 6);
        CHECK(result->fetched_bytes == 600);
    }

    CHECK(server.served_chunks() == std::vector<ByteRange>(plan.begin() + 4, plan.end()));
    CHECK(read_text(output) == blob);
    CHECK_FALSE(ResumeStateStore::exists(state_path));
}

TEST_CASE("BlobTransfer discards resume state for different content", "[blob_transfer]") {
    TempDir dir;
    const auto state_path = dir / "blob.bin.xferstate";
    const auto blob = make_blob(800);

    TransferState stale;
    stale.content_size = 1600;
    stale.completed_chunks = {{0, 99}, {100, 199}};
    stale.touch();

    SECTION("Different size") {
        stale.url = URL;
    }

    SECTION("Different URL") {
        stale.url = "https://example.com/datasets/other.bin";
        stale.content_size = 800;
    }

    REQUIRE_FALSE(ResumeStateStore::save(state_path, stale));

    FakeBlobServer server(blob);
    MemoryDestination destination;
    BlobTransfer transfer(server);

    auto request = make_request(destination, 100, 4);
    request.resume = true;
    request.resume_state_path = state_path;

    auto result = transfer.run(request);
    REQUIRE(result);
    CHECK(result->resumed_chunks == 0);
    CHECK(result->fetched_chunks == 8);
    CHECK(server.served_chunks().size() == 8);
    CHECK(to_string(destination.data()) == blob);
    CHECK_FALSE(ResumeStateStore::exists(state_path));
}

TEST_CASE("BlobTransfer ignores unusable resume state files", "[blob_transfer]") {
    TempDir dir;
    const auto state_path = dir / "blob.bin.xferstate";
    write_text(state_path, "{\"url\": ");

    const auto blob = make_blob(300);
    FakeBlobServer server(blob);
    MemoryDestination destination;
    BlobTransfer transfer(server);

    auto request = make_request(destination, 100, 2);
    request.resume = true;
    request.resume_state_path = state_path;

    auto result = transfer.run(request);
    REQUIRE(result);
    CHECK(result->fetched_chunks == 3);
    CHECK(to_string(destination.data()) == blob);
    CHECK_FALSE(ResumeStateStore::exists(state_path));
}

TEST_CASE("BlobTransfer treats a changed chunk size as a fresh start", "[blob_transfer]") {
    TempDir dir;
    const auto state_path = dir / "blob.bin.xferstate";
    const auto blob = make_blob(800);

    TransferState previous;
    previous.url = URL;
    previous.content_size = 800;
    previous.completed_chunks = {{0, 199}, {200, 399}};  // Planned with 200-byte chunks
    previous.touch();
    REQUIRE_FALSE(ResumeStateStore::save(state_path, previous));

    FakeBlobServer server(blob);
    MemoryDestination destination;
    BlobTransfer transfer(server);

    auto request = make_request(destination, 100, 2);
    request.resume = true;
    request.resume_state_path = state_path;

    auto result = transfer.run(request);
    REQUIRE(result);
    CHECK(result->resumed_chunks == 0);
    CHECK(result->fetched_chunks == 8);
    CHECK(to_string(destination.data()) == blob);
}

TEST_CASE("BlobTransfer removes the resume state after success", "[blob_transfer]") {
    TempDir dir;
    const auto state_path = dir / "blob.bin.xferstate";
    const auto blob = make_blob(500);

    TransferState previous;
    previous.url = URL;
    previous.content_size = 500;
    previous.completed_chunks = {{0, 99}};
    previous.touch();
    REQUIRE_FALSE(ResumeStateStore::save(state_path, previous));

    FakeBlobServer server(blob);
    MemoryDestination destination;
    // The resumed chunk is already in place from the earlier run
    REQUIRE_FALSE(destination.write(blob.data(), 100));

    auto request = make_request(destination, 100, 2);
    request.resume = true;
    request.resume_state_path = state_path;

    BlobTransfer transfer(server);
    auto result = transfer.run(request);
    REQUIRE(result);
    CHECK(result->resumed_chunks == 1);
    CHECK(to_string(destination.data()) == blob);
    CHECK_FALSE(ResumeStateStore::exists(state_path));
}

TEST_CASE("BlobTransfer persists exactly the written chunks on failure", "[blob_transfer]") {
    TempDir dir;
    const auto state_path = dir / "blob.bin.xferstate";
    const auto blob = make_blob(2000);
    const auto plan = split_range(0, 1999, 100);

    SECTION("Single worker") {
        FakeBlobServer server(blob);
        server.fail({plan[7], 0});
        MemoryDestination destination;

        auto request = make_request(destination, 100, 1);
        request.resume = true;
        request.resume_state_path = state_path;

        BlobTransfer transfer(server);
        auto result = transfer.run(request);
        REQUIRE_FALSE(result);
        CHECK(result.error().cause == TransferErrc::network_error);

        CHECK(loaded_chunks(state_path) == std::set<ByteRange>(plan.begin(), plan.begin() + 7));
        // Nothing after the failing chunk was requested
        CHECK(server.served_chunks().size() == 7);
    }

    SECTION("Several workers") {
        FakeBlobServer server(blob);
        server.fail({plan[5], 500});
        MemoryDestination destination;

        auto request = make_request(destination, 100, 4);
        request.resume = true;
        request.resume_state_path = state_path;

        BlobTransfer transfer(server);
        auto result = transfer.run(request);
        REQUIRE_FALSE(result);
        CHECK(*result.error().range == plan[5]);

        auto served = server.served_chunks();
        auto recorded = loaded_chunks(state_path);
        CHECK(recorded == std::set<ByteRange>(served.begin(), served.end()));
        CHECK_FALSE(recorded.contains(plan[5]));
        CHECK(recorded.size() < plan.size());

        const auto data = to_string(destination.data());
        for (const auto& range : recorded) {
            REQUIRE(data.size() > range.end);
            CHECK(data.substr(range.start, range.size()) == blob.substr(range.start, range.size()));
        }
    }

    SECTION("Failure on the first chunk still leaves a state file") {
        FakeBlobServer server(blob);
        server.fail({plan[0], 500});
        MemoryDestination destination;

        auto request = make_request(destination, 100, 1);
        request.resume = true;
        request.resume_state_path = state_path;

        BlobTransfer transfer(server);
        REQUIRE_FALSE(transfer.run(request));
        CHECK(loaded_chunks(state_path).empty());
    }
}

TEST_CASE("BlobTransfer without resume writes no state", "[blob_transfer]") {
    TempDir dir;
    const auto state_path = dir / "blob.bin.xferstate";
    const auto blob = make_blob(500);

    FakeBlobServer server(blob);
    server.fail({ByteRange{200, 299}, 500});
    MemoryDestination destination;

    auto request = make_request(destination, 100, 1);
    request.resume_state_path = state_path;

    BlobTransfer transfer(server);
    auto result = transfer.run(request);
    REQUIRE_FALSE(result);
    CHECK_FALSE(ResumeStateStore::exists(state_path));
}

TEST_CASE("BlobTransfer falls back to a single download", "[blob_transfer]") {
    const auto blob = make_blob(5000);
    auto workers = GENERATE(1u, 4u, 16u);

    FakeBlobServer server(blob, false);
    MemoryDestination destination;
    BlobTransfer transfer(server);

    auto result = transfer.run(make_request(destination, 100, workers));
    REQUIRE(result);
    CHECK_FALSE(result->ranged);
    CHECK(result->content_size == 5000);
    CHECK(result->total_chunks == 1);
    CHECK(result->workers == 1);
    CHECK(to_string(destination.data()) == blob);

    // Probe plus one plain GET
    auto requests = server.requests();
    REQUIRE(requests.size() == 2);
    CHECK_FALSE(requests[1].headers.contains("Range"));
    CHECK(server.served_chunks().empty());
}

TEST_CASE("BlobTransfer fallback ignores resume state", "[blob_transfer]") {
    TempDir dir;
    const auto state_path = dir / "blob.bin.xferstate";
    const auto blob = make_blob(300);

    TransferState previous;
    previous.url = URL;
    previous.content_size = 300;
    previous.completed_chunks = {{0, 99}};
    REQUIRE_FALSE(ResumeStateStore::save(state_path, previous));

    FakeBlobServer server(blob, false);
    MemoryDestination destination;
    BlobTransfer transfer(server);

    auto request = make_request(destination, 100, 3);
    request.resume = true;
    request.resume_state_path = state_path;

    auto result = transfer.run(request);
    REQUIRE(result);
    CHECK(result->resumed_chunks == 0);
    CHECK(to_string(destination.data()) == blob);
    CHECK_FALSE(ResumeStateStore::exists(state_path));
}

TEST_CASE("BlobTransfer of an empty object", "[blob_transfer]") {
    FakeBlobServer server("");
    MemoryDestination destination;
    BlobTransfer transfer(server);

    auto result = transfer.run(make_request(destination, 100, 3));
    REQUIRE(result);
    CHECK(result->content_size == 0);
    CHECK(result->total_chunks == 0);
    CHECK(result->workers == 0);
    CHECK(destination.data().empty());
    CHECK(server.requests().size() == 1);
}

TEST_CASE("BlobTransfer trims stale bytes past the content", "[blob_transfer]") {
    const auto blob = make_blob(300);
    FakeBlobServer server(blob);
    MemoryDestination destination;
    const std::string leftover(1000, 'x');
    REQUIRE_FALSE(destination.write(leftover.data(), leftover.size()));

    BlobTransfer transfer(server);
    auto result = transfer.run(make_request(destination, 128, 2));
    REQUIRE(result);
    CHECK(to_string(destination.data()) == blob);
}

TEST_CASE("BlobTransfer probe failures", "[blob_transfer]") {
    FakeBlobServer server(make_blob(100));
    server.respond_with(500);
    MemoryDestination destination;
    BlobTransfer transfer(server);

    auto result = transfer.run(make_request(destination, 10, 2));
    REQUIRE_FALSE(result);
    CHECK(result.error().code == TransferErrc::probe_failed);
    CHECK(result.error().status_code == 500);
    CHECK(server.requests().size() == 1);
    CHECK(transfer.phase() == TransferPhase::failed);
}

TEST_CASE("BlobTransfer rejects invalid requests", "[blob_transfer]") {
    FakeBlobServer server(make_blob(100));
    MemoryDestination destination;
    BlobTransfer transfer(server);
    auto request = make_request(destination, 10, 2);

    SECTION("Empty URL") { request.url.clear(); }
    SECTION("No destination") { request.destination = nullptr; }
    SECTION("Zero chunk size") { request.chunk_size = 0; }
    SECTION("Zero workers") { request.max_workers = 0; }
    SECTION("Resume without a state path") { request.resume = true; }

    auto result = transfer.run(request);
    REQUIRE_FALSE(result);
    CHECK(result.error().code == TransferErrc::invalid_request);
    CHECK(server.requests().empty());
}

TEST_CASE("BlobTransfer sends caller headers on every request", "[blob_transfer]") {
    FakeBlobServer server(make_blob(450));
    MemoryDestination destination;
    BlobTransfer transfer(server);

    auto request = make_request(destination, 100, 3);
    request.headers = {{"Authorization", "Bearer token-123"}, {"X-Api-Key", "key"}};

    REQUIRE(transfer.run(request));

    auto requests = server.requests();
    REQUIRE(requests.size() == 6);  // Probe + 5 chunks
    for (const auto& sent : requests) {
        CHECK(sent.url == URL);
        CHECK(sent.headers.at("Authorization") == "Bearer token-123");
        CHECK(sent.headers.at("X-Api-Key") == "key");
        CHECK(sent.headers.contains("Range"));
    }
}

TEST_CASE("BlobTransfer reports progress", "[blob_transfer]") {
    const auto blob = make_blob(1000);
    FakeBlobServer server(blob);
    MemoryDestination destination;
    BlobTransfer transfer(server);

    std::mutex mutex;
    std::vector<TransferProgress> reports;

    auto request = make_request(destination, 100, 4);
    request.on_progress = [&](const TransferProgress& p) {
        std::lock_guard<std::mutex> lock(mutex);
        reports.push_back(p);
    };

    REQUIRE(transfer.run(request));
    REQUIRE(reports.size() == 10);

    std::set<std::uint32_t> counts;
    for (const auto& p : reports) {
        CHECK(p.total_bytes == 1000);
        CHECK(p.total_chunks == 10);
        CHECK(p.completed_bytes == p.completed_chunks * 100u);
        counts.insert(p.completed_chunks);
    }
    // Every completion produced a distinct count, the last one being 100%
    CHECK(counts.size() == 10);
    CHECK(*counts.rbegin() == 10);

    auto last = std::max_element(reports.begin(), reports.end(),
                                 [](const auto& a, const auto& b) { return a.completed_chunks < b.completed_chunks; });
    CHECK(last->percent == Catch::Approx(100.0));
}

TEST_CASE("BlobTransfer survives a throwing progress callback", "[blob_transfer]") {
    const auto blob = make_blob(300);
    FakeBlobServer server(blob);
    MemoryDestination destination;
    BlobTransfer transfer(server);

    auto request = make_request(destination, 100, 2);
    request.on_progress = [](const TransferProgress&) { throw std::runtime_error("display gone"); };

    auto result = transfer.run(request);
    REQUIRE(result);
    CHECK(to_string(destination.data()) == blob);
}

TEST_CASE("BlobTransfer adaptive chunk size", "[blob_transfer]") {
    SECTION("Small objects get smaller chunks, at least 1 MiB") {
        CHECK(BlobTransfer::adaptive_chunk_size(2 * MiB, 8 * MiB) == 2 * MiB);
        CHECK(BlobTransfer::adaptive_chunk_size(2 * MiB, 2 * MiB) == MiB);
        CHECK(BlobTransfer::adaptive_chunk_size(512 * 1024, 100) == 512 * 1024);
    }

    SECTION("Medium objects keep the requested size") {
        CHECK(BlobTransfer::adaptive_chunk_size(2 * MiB, 50 * MiB) == 2 * MiB);
        CHECK(BlobTransfer::adaptive_chunk_size(2 * MiB, 100 * MiB) == 2 * MiB);
    }

    SECTION("Large objects get larger chunks, at most 32 MiB") {
        CHECK(BlobTransfer::adaptive_chunk_size(2 * MiB, 200 * MiB) == 20 * MiB);
        CHECK(BlobTransfer::adaptive_chunk_size(2 * MiB, 4096 * MiB) == 32 * MiB);
        CHECK(BlobTransfer::adaptive_chunk_size(64 * MiB, 4096 * MiB) == 64 * MiB);
    }

    SECTION("Applied to a transfer") {
        const auto blob = make_blob(3000);
        FakeBlobServer server(blob);
        MemoryDestination destination;
        BlobTransfer transfer(server);

        auto request = make_request(destination, 100, 2);
        request.adaptive_chunk_size = true;

        auto result = transfer.run(request);
        REQUIRE(result);
        // min(100, max(1 MiB, 750)) keeps the requested 100 bytes
        CHECK(result->chunk_size == 100);
        CHECK(to_string(destination.data()) == blob);
    }
}

TEST_CASE("BlobTransfer::stream", "[blob_transfer]") {
    const auto blob = make_blob(2048);
    FakeBlobServer server(blob);
    MemoryDestination destination;
    BlobTransfer transfer(server);

    auto written = transfer.stream(URL, {}, destination);
    REQUIRE(written);
    CHECK(*written == 2048);
    CHECK(to_string(destination.data()) == blob);
    CHECK(transfer.phase() == TransferPhase::completed);
}

TEST_CASE("TransferPhase names", "[blob_transfer]") {
    CHECK(to_string(TransferPhase::not_started) == "not_started");
    CHECK(to_string(TransferPhase::resuming) == "resuming");
    CHECK(to_string(TransferPhase::failed) == "failed");
}
