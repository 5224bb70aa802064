// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <blobxfer/core/config.hpp>
#include <blobxfer/core/http_client.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace blobxfer::cli {

// CLI result: process exit code, or the error that ended the command
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::string url;
    std::string output_file;
    std::string state_file;
    core::Headers headers;
    std::uint32_t workers{core::DEFAULT_MAX_WORKERS};
    std::uint64_t chunk_size{core::DEFAULT_CHUNK_SIZE};
    bool resume{false};
    bool adaptive{false};
    bool verify_ssl{true};
    bool info{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;  // Set when the command line is invalid
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, const char* const argv[]);

// "512K", "16M", "1G" or plain bytes
[[nodiscard]] std::optional<std::uint64_t> parse_size(std::string_view value) noexcept;

// "Name: value"
[[nodiscard]] std::optional<std::pair<std::string, std::string>> parse_header(std::string_view value);

// Last path segment of the URL, "download.bin" when there is none
[[nodiscard]] std::string filename_from_url(std::string_view url);

// Download the URL described by `args`
[[nodiscard]] CliResult download(const CliArgs& args);

// Same, over a caller-supplied client. A leftover state file is removed
// unless --resume reopens an existing output file.
[[nodiscard]] CliResult download(const CliArgs& args, core::HttpClient& client);

// Probe the URL and print its size and range support
[[nodiscard]] CliResult info(const CliArgs& args);

void print_help(std::string_view program_name);

void print_version();

} // namespace blobxfer::cli
