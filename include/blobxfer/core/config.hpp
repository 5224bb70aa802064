// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <cstddef>
#include <string_view>

namespace blobxfer::core {

constexpr std::uint64_t MiB = 1024 * 1024;

constexpr std::uint64_t DEFAULT_CHUNK_SIZE = 2 * MiB;
constexpr std::uint32_t DEFAULT_MAX_WORKERS = 3;

// Adaptive chunk sizing bounds
constexpr std::uint64_t SMALL_OBJECT_SIZE = 10 * MiB;
constexpr std::uint64_t LARGE_OBJECT_SIZE = 100 * MiB;
constexpr std::uint64_t MIN_ADAPTIVE_CHUNK = 1 * MiB;
constexpr std::uint64_t MAX_ADAPTIVE_CHUNK = 32 * MiB;

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 60;
constexpr std::uint32_t MAX_REDIRECTS = 10;

constexpr std::size_t STREAM_BUFFER_SIZE = 512 * 1024;   // 512 KB

constexpr std::uint32_t STATE_SCHEMA_VERSION = 1;
constexpr std::string_view STATE_FILE_SUFFIX = ".xferstate";

} // namespace blobxfer::core
