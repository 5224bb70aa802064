// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <blobxfer/core/logging.hpp>
#include <blobxfer/core/resume_state.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/ostream_sink.h>
#include "temp_dir.hpp"
#include <sstream>

using namespace blobxfer::core;
using blobxfer::test::TempDir;
using blobxfer::test::read_text;
using blobxfer::test::write_text;

namespace {

TransferState sample_state() {
    TransferState state;
    state.url = "https://example.com/data/blob.bin";
    state.content_size = 1000;
    state.completed_chunks = {{0, 99}, {200, 299}, {900, 999}};
    state.timestamp = 1700000000.5;
    return state;
}

const FreshStart* fresh(const ResumeLoad& load) {
    return std::get_if<FreshStart>(&load);
}

// Routes the "blobxfer" logger into a string while alive
class CapturedLog {
public:
    CapturedLog() {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out_);
        sink->set_pattern("%l %v");
        auto log = std::make_shared<spdlog::logger>("blobxfer", std::move(sink));
        log->set_level(spdlog::level::trace);
        spdlog::drop("blobxfer");
        spdlog::register_logger(log);
    }

    ~CapturedLog() { init_logging(LogConfig{}); }

    CapturedLog(const CapturedLog&) = delete;
    CapturedLog& operator=(const CapturedLog&) = delete;

    [[nodiscard]] std::string text() const { return out_.str(); }

private:
    std::ostringstream out_;
};

} // namespace

TEST_CASE("TransferState JSON layout", "[resume_state]") {
    nlohmann::json j = sample_state();

    CHECK(j["schema_version"] == STATE_SCHEMA_VERSION);
    CHECK(j["url"] == "https://example.com/data/blob.bin");
    CHECK(j["content_size"] == 1000);
    CHECK(j["timestamp"] == 1700000000.5);
    CHECK(j["completed_chunks"] == nlohmann::json::parse("[[0,99],[200,299],[900,999]]"));
}

TEST_CASE("TransferState::completed_bytes", "[resume_state]") {
    CHECK(sample_state().completed_bytes() == 300);
    CHECK(TransferState{}.completed_bytes() == 0);
}

TEST_CASE("ResumeStateStore save and load", "[resume_state]") {
    TempDir dir;
    auto path = dir / "blob.bin.xferstate";

    SECTION("Saved state loads back") {
        REQUIRE_FALSE(ResumeStateStore::save(path, sample_state()));
        CHECK(ResumeStateStore::exists(path));

        auto loaded = ResumeStateStore::load(path);
        REQUIRE(std::holds_alternative<Resumed>(loaded));
        const auto& state = std::get<Resumed>(loaded).state;
        CHECK(state.url == "https://example.com/data/blob.bin");
        CHECK(state.content_size == 1000);
        CHECK(state.completed_chunks == sample_state().completed_chunks);
        CHECK(state.timestamp == 1700000000.5);
    }

    SECTION("Save replaces the previous file and leaves no temporary behind") {
        REQUIRE_FALSE(ResumeStateStore::save(path, sample_state()));
        auto updated = sample_state();
        updated.completed_chunks.insert({100, 199});
        REQUIRE_FALSE(ResumeStateStore::save(path, updated));

        auto loaded = ResumeStateStore::load(path);
        REQUIRE(std::holds_alternative<Resumed>(loaded));
        CHECK(std::get<Resumed>(loaded).state.completed_chunks.size() == 4);

        auto tmp = path;
        tmp += ".tmp";
        CHECK_FALSE(std::filesystem::exists(tmp));
    }

    SECTION("Parent directories are created") {
        auto nested = dir / "a/b/c/state.json";
        REQUIRE_FALSE(ResumeStateStore::save(nested, sample_state()));
        CHECK(std::filesystem::exists(nested));
    }

    SECTION("File without a schema version is version 1") {
        write_text(path, R"({"url":"u","content_size":10,"completed_chunks":[[0,4]],"timestamp":1.0})");
        auto loaded = ResumeStateStore::load(path);
        REQUIRE(std::holds_alternative<Resumed>(loaded));
        CHECK(std::get<Resumed>(loaded).state.schema_version == 1);
        CHECK(std::get<Resumed>(loaded).state.completed_chunks.size() == 1);
    }

    SECTION("Empty completed list") {
        auto state = sample_state();
        state.completed_chunks.clear();
        REQUIRE_FALSE(ResumeStateStore::save(path, state));
        auto loaded = ResumeStateStore::load(path);
        REQUIRE(std::holds_alternative<Resumed>(loaded));
        CHECK(std::get<Resumed>(loaded).state.completed_chunks.empty());
    }
}

TEST_CASE("ResumeStateStore soft failures start fresh", "[resume_state]") {
    TempDir dir;
    auto path = dir / "state.json";

    SECTION("Missing file") {
        CHECK(fresh(ResumeStateStore::load(path)));
    }

    SECTION("Not JSON") {
        write_text(path, "{ this is not json");
        CHECK(fresh(ResumeStateStore::load(path)));
    }

    SECTION("Truncated JSON") {
        auto text = nlohmann::json(sample_state()).dump();
        write_text(path, text.substr(0, text.size() / 2));
        CHECK(fresh(ResumeStateStore::load(path)));
    }

    SECTION("JSON that is not an object") {
        write_text(path, "[1, 2, 3]");
        CHECK(fresh(ResumeStateStore::load(path)));
    }

    SECTION("Missing fields") {
        write_text(path, R"({"url":"u","completed_chunks":[],"timestamp":1.0})");
        CHECK(fresh(ResumeStateStore::load(path)));

        write_text(path, R"({"url":"u","content_size":10,"timestamp":1.0})");
        CHECK(fresh(ResumeStateStore::load(path)));
    }

    SECTION("Wrong field types") {
        write_text(path, R"({"url":"u","content_size":"ten","completed_chunks":[],"timestamp":1.0})");
        CHECK(fresh(ResumeStateStore::load(path)));

        write_text(path, R"({"url":"u","content_size":10,"completed_chunks":[[0]],"timestamp":1.0})");
        CHECK(fresh(ResumeStateStore::load(path)));
    }

    SECTION("Newer schema version") {
        auto j = nlohmann::json(sample_state());
        j["schema_version"] = STATE_SCHEMA_VERSION + 1;
        write_text(path, j.dump());
        CHECK(fresh(ResumeStateStore::load(path)));
    }

    SECTION("Chunk outside the content") {
        auto state = sample_state();
        state.completed_chunks.insert({950, 1000});
        REQUIRE_FALSE(ResumeStateStore::save(path, state));
        CHECK(fresh(ResumeStateStore::load(path)));
    }

    SECTION("Inverted chunk") {
        write_text(path, R"({"url":"u","content_size":10,"completed_chunks":[[5,2]],"timestamp":1.0})");
        CHECK(fresh(ResumeStateStore::load(path)));
    }
}

TEST_CASE("ResumeStateStore warns on every fresh start", "[resume_state]") {
    TempDir dir;
    auto path = dir / "state.json";
    CapturedLog log;

    SECTION("Missing file") {
        REQUIRE(fresh(ResumeStateStore::load(path)));
    }

    SECTION("Corrupt file") {
        write_text(path, "not json");
        REQUIRE(fresh(ResumeStateStore::load(path)));
    }

    CHECK(log.text().starts_with("warning "));
    CHECK_THAT(log.text(), Catch::Matchers::ContainsSubstring(path.string()));
}

TEST_CASE("ResumeStateStore::clear", "[resume_state]") {
    TempDir dir;
    auto path = dir / "state.json";

    REQUIRE_FALSE(ResumeStateStore::save(path, sample_state()));
    CHECK_FALSE(ResumeStateStore::clear(path));
    CHECK_FALSE(ResumeStateStore::exists(path));

    // Clearing again is not an error
    CHECK_FALSE(ResumeStateStore::clear(path));
}

TEST_CASE("ResumeStateStore::matches", "[resume_state]") {
    auto state = sample_state();
    CHECK(ResumeStateStore::matches(state, "https://example.com/data/blob.bin", 1000));
    CHECK_FALSE(ResumeStateStore::matches(state, "https://example.com/data/blob.bin", 1001));
    CHECK_FALSE(ResumeStateStore::matches(state, "https://example.com/data/other.bin", 1000));
}

TEST_CASE("ResumeStateStore::sidecar_path", "[resume_state]") {
    SECTION("Keyed by destination") {
        CHECK(ResumeStateStore::sidecar_path("downloads/blob.bin") ==
              std::filesystem::path("downloads/blob.bin.xferstate"));
    }

    SECTION("Keyed by destination and URL") {
        auto a = ResumeStateStore::sidecar_path("blob.bin", "https://a.example.com/blob.bin");
        auto b = ResumeStateStore::sidecar_path("blob.bin", "https://b.example.com/blob.bin");
        auto a_again = ResumeStateStore::sidecar_path("blob.bin", "https://a.example.com/blob.bin");

        CHECK(a != b);
        CHECK(a == a_again);
        CHECK(a.string().starts_with("blob.bin."));
        CHECK(a.string().ends_with(".xferstate"));
        // "blob.bin." + 16 hex digits + ".xferstate"
        CHECK(a.string().size() == std::string("blob.bin.").size() + 16 + std::string(".xferstate").size());
    }
}
