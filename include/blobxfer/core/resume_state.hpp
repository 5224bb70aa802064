// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <blobxfer/core/byte_range.hpp>
#include <blobxfer/core/config.hpp>
#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

namespace blobxfer::core {

// Persisted progress of one download, keyed by (url, content_size)
struct TransferState {
    std::uint32_t schema_version{STATE_SCHEMA_VERSION};
    std::string url;
    std::uint64_t content_size{0};
    std::set<ByteRange> completed_chunks;
    double timestamp{0.0};  // Seconds since epoch of the last update

    [[nodiscard]] std::uint64_t completed_bytes() const noexcept;

    // Set timestamp to now
    void touch() noexcept;
};

void to_json(nlohmann::json& j, const TransferState& state);
void from_json(const nlohmann::json& j, TransferState& state);

// Outcome of loading a state file. A missing or unusable file is not an
// error, it just means the download starts from scratch.
struct FreshStart {
    std::string reason;
};

struct Resumed {
    TransferState state;
};

using ResumeLoad = std::variant<FreshStart, Resumed>;

class ResumeStateStore {
public:
    // FreshStart when the file is absent, not JSON, missing fields,
    // from a newer schema, or lists chunks outside the content.
    // Every FreshStart is logged at warning level.
    [[nodiscard]] static ResumeLoad load(const std::filesystem::path& path) noexcept;

    // Write to a temporary sibling, then rename over `path`.
    // Creates parent directories if needed.
    [[nodiscard]] static std::error_code save(const std::filesystem::path& path,
                                              const TransferState& state) noexcept;

    // Delete the file; missing files are fine
    [[nodiscard]] static std::error_code clear(const std::filesystem::path& path) noexcept;

    [[nodiscard]] static bool exists(const std::filesystem::path& path) noexcept;

    [[nodiscard]] static bool matches(const TransferState& state,
                                      std::string_view url,
                                      std::uint64_t content_size) noexcept;

    // "<destination>.xferstate"
    [[nodiscard]] static std::filesystem::path sidecar_path(const std::filesystem::path& destination);

    // "<destination>.<fnv1a-64 of url>.xferstate", for several URLs sharing one local name
    [[nodiscard]] static std::filesystem::path sidecar_path(const std::filesystem::path& destination,
                                                            std::string_view url);
};

} // namespace blobxfer::core
