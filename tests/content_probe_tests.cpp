// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <blobxfer/core/content_probe.hpp>
#include "fake_blob_server.hpp"

using namespace blobxfer::core;
using blobxfer::test::FakeBlobServer;
using blobxfer::test::make_blob;

TEST_CASE("ContentProbe with range support", "[content_probe]") {
    FakeBlobServer server(make_blob(12345));
    ContentProbe probe(server);

    auto result = probe.probe("https://example.com/blob", {});
    REQUIRE(result);
    CHECK(result->content_size == 12345);
    CHECK(result->supports_ranges);

    auto requests = server.requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].headers.at("Range") == "bytes=0-0");
}

TEST_CASE("ContentProbe without range support", "[content_probe]") {
    FakeBlobServer server(make_blob(5000), false);
    ContentProbe probe(server);

    SECTION("Size from Content-Length") {
        auto result = probe.probe("https://example.com/blob", {});
        REQUIRE(result);
        CHECK(result->content_size == 5000);
        CHECK_FALSE(result->supports_ranges);
    }

    SECTION("No Content-Length is a probe failure") {
        server.drop_content_length();
        auto result = probe.probe("https://example.com/blob", {});
        REQUIRE_FALSE(result);
        CHECK(result.error().code == TransferErrc::probe_failed);
        CHECK(result.error().status_code == 200);
    }
}

TEST_CASE("ContentProbe of an empty object", "[content_probe]") {
    FakeBlobServer server("");
    ContentProbe probe(server);

    auto result = probe.probe("https://example.com/empty", {});
    REQUIRE(result);
    CHECK(result->content_size == 0);
    CHECK(result->supports_ranges);
}

TEST_CASE("ContentProbe failures", "[content_probe]") {
    FakeBlobServer server(make_blob(100));
    ContentProbe probe(server);

    SECTION("Server error status") {
        server.respond_with(503);
        auto result = probe.probe("https://example.com/blob", {});
        REQUIRE_FALSE(result);
        CHECK(result.error().code == TransferErrc::probe_failed);
        CHECK(result.error().cause == TransferErrc::unexpected_status);
        CHECK(result.error().status_code == 503);
        CHECK_FALSE(result.error().range);
    }

    SECTION("Not found") {
        server.respond_with(404);
        auto result = probe.probe("https://example.com/missing", {});
        REQUIRE_FALSE(result);
        CHECK(result.error().status_code == 404);
        CHECK_THAT(result.error().message(), Catch::Matchers::ContainsSubstring("404"));
    }

    SECTION("206 without Content-Range") {
        server.respond_with(206);
        auto result = probe.probe("https://example.com/blob", {});
        REQUIRE_FALSE(result);
        CHECK(result.error().code == TransferErrc::probe_failed);
        CHECK(result.error().cause == TransferErrc::range_mismatch);
    }
}

TEST_CASE("ContentProbe passes caller headers through", "[content_probe]") {
    FakeBlobServer server(make_blob(10));
    ContentProbe probe(server);

    Headers headers{{"Authorization", "Bearer secret"}, {"X-Api-Key", "k"}, {"range", "bytes=5-9"}};
    auto result = probe.probe("https://example.com/blob", headers);
    REQUIRE(result);

    auto requests = server.requests();
    REQUIRE(requests.size() == 1);
    const auto& sent = requests[0].headers;
    CHECK(sent.at("Authorization") == "Bearer secret");
    CHECK(sent.at("X-Api-Key") == "k");
    CHECK(sent.at("Range") == "bytes=0-0");
    CHECK_FALSE(sent.contains("range"));
}
