// Copyright (c) 2026 changcheng967. All rights reserved.

#include <blobxfer/core/resume_state.hpp>
#include <blobxfer/core/logging.hpp>
#include <blobxfer/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <format>
#include <fstream>
#include <utility>

namespace blobxfer::core {

namespace {

std::uint64_t fnv1a(std::string_view s) noexcept {
    std::uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : s) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

std::filesystem::path temp_path(const std::filesystem::path& path) {
    auto tmp = path;
    tmp += ".tmp";
    return tmp;
}

} // namespace

//=============================================================================
// TransferState
//=============================================================================

std::uint64_t TransferState::completed_bytes() const noexcept {
    std::uint64_t total = 0;
    for (const auto& chunk : completed_chunks) {
        total += chunk.size();
    }
    return total;
}

void TransferState::touch() noexcept {
    using namespace std::chrono;
    timestamp = duration<double>(system_clock::now().time_since_epoch()).count();
}

void to_json(nlohmann::json& j, const TransferState& state) {
    auto chunks = nlohmann::json::array();
    for (const auto& chunk : state.completed_chunks) {
        chunks.push_back({chunk.start, chunk.end});
    }

    j = nlohmann::json{
        {"schema_version", state.schema_version},
        {"url", state.url},
        {"content_size", state.content_size},
        {"completed_chunks", std::move(chunks)},
        {"timestamp", state.timestamp},
    };
}

void from_json(const nlohmann::json& j, TransferState& state) {
    // Files written before the version field existed are version 1
    state.schema_version = j.value("schema_version", 1u);
    j.at("url").get_to(state.url);
    j.at("content_size").get_to(state.content_size);
    j.at("timestamp").get_to(state.timestamp);

    state.completed_chunks.clear();
    for (const auto& item : j.at("completed_chunks")) {
        auto [start, end] = item.get<std::pair<std::uint64_t, std::uint64_t>>();
        state.completed_chunks.insert({start, end});
    }
}

//=============================================================================
// ResumeStateStore
//=============================================================================

ResumeLoad ResumeStateStore::load(const std::filesystem::path& path) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            logger()->warn("No resume state at {}, starting from scratch", path.string());
            return FreshStart{"no resume state file"};
        }

        auto j = nlohmann::json::parse(file, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            logger()->warn("Ignoring resume state {}: not valid JSON", path.string());
            return FreshStart{"resume state is not valid JSON"};
        }

        auto state = j.get<TransferState>();

        if (state.schema_version > STATE_SCHEMA_VERSION) {
            logger()->warn("Ignoring resume state {}: schema version {} is newer than {}",
                           path.string(), state.schema_version, STATE_SCHEMA_VERSION);
            return FreshStart{"unsupported schema version"};
        }

        for (const auto& chunk : state.completed_chunks) {
            if (chunk.start > chunk.end || chunk.end >= state.content_size) {
                logger()->warn("Ignoring resume state {}: chunk {} outside content of {} bytes",
                               path.string(), chunk.to_string(), state.content_size);
                return FreshStart{"chunk outside content"};
            }
        }

        return Resumed{std::move(state)};
    } catch (const nlohmann::json::exception& e) {
        logger()->warn("Ignoring resume state {}: {}", path.string(), e.what());
        return FreshStart{"missing or malformed fields"};
    } catch (const std::exception& e) {
        logger()->warn("Ignoring resume state {}: {}", path.string(), e.what());
        return FreshStart{"unreadable resume state"};
    }
}

std::error_code ResumeStateStore::save(const std::filesystem::path& path,
                                       const TransferState& state) noexcept {
    try {
        std::error_code ec;
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                return make_error_code(disk::DiskErrc::invalid_path);
            }
        }

        const auto tmp = temp_path(path);
        {
            std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
            if (!file) {
                return make_error_code(disk::DiskErrc::write_error);
            }
            file << nlohmann::json(state).dump();
            file.flush();
            if (!file) {
                std::filesystem::remove(tmp, ec);
                return make_error_code(disk::DiskErrc::write_error);
            }
        }

        // Readers see either the old file or the new one, never a partial write
        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            return make_error_code(disk::DiskErrc::rename_error);
        }
        return {};
    } catch (const std::exception& e) {
        logger()->error("Failed to save resume state {}: {}", path.string(), e.what());
        return make_error_code(disk::DiskErrc::write_error);
    }
}

std::error_code ResumeStateStore::clear(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return make_error_code(disk::DiskErrc::access_denied);
    }
    return {};
}

bool ResumeStateStore::exists(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

bool ResumeStateStore::matches(const TransferState& state,
                               std::string_view url,
                               std::uint64_t content_size) noexcept {
    return state.url == url && state.content_size == content_size;
}

std::filesystem::path ResumeStateStore::sidecar_path(const std::filesystem::path& destination) {
    auto p = destination;
    p += std::string(STATE_FILE_SUFFIX);
    return p;
}

std::filesystem::path ResumeStateStore::sidecar_path(const std::filesystem::path& destination,
                                                     std::string_view url) {
    auto p = destination;
    p += std::format(".{:016x}", fnv1a(url));
    p += std::string(STATE_FILE_SUFFIX);
    return p;
}

} // namespace blobxfer::core
