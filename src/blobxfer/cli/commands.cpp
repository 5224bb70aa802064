// Copyright (c) 2026 changcheng967. All rights reserved.

#include <blobxfer/cli/commands.hpp>
#include <blobxfer/cli/progress_bar.hpp>
#include <blobxfer/core/blob_transfer.hpp>
#include <blobxfer/core/byte_range.hpp>
#include <blobxfer/core/content_probe.hpp>
#include <blobxfer/core/http_session.hpp>
#include <blobxfer/core/logging.hpp>
#include <blobxfer/core/resume_state.hpp>
#include <blobxfer/disk/file_destination.hpp>
#include <blobxfer/version.hpp>
#include <chrono>
#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>

namespace chrono = std::chrono;

namespace blobxfer::cli {

namespace {

core::HttpSession make_session(const CliArgs& args) {
    core::HttpClientConfig config;
    config.verify_ssl = args.verify_ssl;
    return core::HttpSession(config);
}

// Removes a state file left over from an earlier run of `output`
std::error_code discard_state(const std::filesystem::path& state_path, const std::string& output) {
    if (!core::ResumeStateStore::exists(state_path)) {
        return {};
    }
    core::logger()->warn("Removing resume state {}: {} no longer holds its chunks",
                         state_path.string(), output);
    return core::ResumeStateStore::clear(state_path);
}

// Fetches the value following an option, or records an error
const char* option_value(int argc, const char* const argv[], int& i, CliArgs& args) {
    if (i + 1 >= argc) {
        args.error = std::string("Missing value for ") + argv[i];
        return nullptr;
    }
    return argv[++i];
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, const char* const argv[]) {
    CliArgs args;

    for (int i = 1; i < argc && args.error.empty(); ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-i" || arg == "--info") {
            args.info = true;
        } else if (arg == "-r" || arg == "--resume") {
            args.resume = true;
        } else if (arg == "--adaptive") {
            args.adaptive = true;
        } else if (arg == "--no-verify-ssl") {
            args.verify_ssl = false;
        } else if (arg == "-o" || arg == "--output") {
            if (auto* value = option_value(argc, argv, i, args)) {
                args.output_file = value;
            }
        } else if (arg == "--state-file") {
            if (auto* value = option_value(argc, argv, i, args)) {
                args.state_file = value;
            }
        } else if (arg == "-w" || arg == "--workers") {
            if (auto* value = option_value(argc, argv, i, args)) {
                auto workers = core::parse_uint(value);
                if (!workers || *workers == 0 || *workers > 256) {
                    args.error = std::string("Invalid worker count: ") + value;
                } else {
                    args.workers = static_cast<std::uint32_t>(*workers);
                }
            }
        } else if (arg == "-c" || arg == "--chunk-size") {
            if (auto* value = option_value(argc, argv, i, args)) {
                auto size = parse_size(value);
                if (!size || *size == 0) {
                    args.error = std::string("Invalid chunk size: ") + value;
                } else {
                    args.chunk_size = *size;
                }
            }
        } else if (arg == "-H" || arg == "--header") {
            if (auto* value = option_value(argc, argv, i, args)) {
                auto header = parse_header(value);
                if (!header) {
                    args.error = std::string("Invalid header: ") + value;
                } else {
                    args.headers[header->first] = header->second;
                }
            }
        } else if (arg.starts_with("-")) {
            args.error = std::string("Unknown option: ") + std::string(arg);
        } else if (args.url.empty()) {
            args.url = arg;
        } else {
            args.error = "Only one URL may be given";
        }
    }

    if (args.error.empty() && args.url.empty()) {
        args.error = "No URL specified";
    }
    return args;
}

std::optional<std::uint64_t> parse_size(std::string_view value) noexcept {
    if (value.empty()) {
        return std::nullopt;
    }

    std::uint64_t multiplier = 1;
    switch (value.back()) {
        case 'k': case 'K': multiplier = 1024ULL; break;
        case 'm': case 'M': multiplier = 1024ULL * 1024; break;
        case 'g': case 'G': multiplier = 1024ULL * 1024 * 1024; break;
        default: break;
    }
    if (multiplier != 1) {
        value.remove_suffix(1);
    }

    auto number = core::parse_uint(value);
    if (!number || *number > UINT64_MAX / multiplier) {
        return std::nullopt;
    }
    return *number * multiplier;
}

std::optional<std::pair<std::string, std::string>> parse_header(std::string_view value) {
    auto colon = value.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return std::nullopt;
    }

    auto name = value.substr(0, colon);
    auto content = value.substr(colon + 1);
    while (!content.empty() && (content.front() == ' ' || content.front() == '\t')) {
        content.remove_prefix(1);
    }
    if (name.find_first_of(" \t") != std::string_view::npos) {
        return std::nullopt;
    }
    return std::make_pair(std::string(name), std::string(content));
}

std::string filename_from_url(std::string_view url) {
    auto scheme_end = url.find("://");
    if (scheme_end != std::string_view::npos) {
        url.remove_prefix(scheme_end + 3);
    }

    // Drop query and fragment
    url = url.substr(0, url.find_first_of("?#"));

    auto path_start = url.find('/');
    if (path_start == std::string_view::npos) {
        return "download.bin";
    }

    auto name = url.substr(url.rfind('/') + 1);
    return name.empty() ? std::string("download.bin") : std::string(name);
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const CliArgs& args) {
    auto session = make_session(args);
    return download(args, session);
}

CliResult download(const CliArgs& args, core::HttpClient& client) {
    const std::string output = args.output_file.empty() ? filename_from_url(args.url) : args.output_file;
    const std::filesystem::path state_path = args.state_file.empty()
        ? core::ResumeStateStore::sidecar_path(output)
        : std::filesystem::path(args.state_file);

    auto destination = disk::FileDestination::open(output, args.resume ? disk::OpenMode::keep
                                                                       : disk::OpenMode::truncate);
    if (!destination) {
        std::cerr << "Error: Cannot open " << output << ": " << destination.error().message() << std::endl;
        return std::unexpected(destination.error());
    }

    // A state file only describes the bytes of the file it was written for
    if (!args.resume || destination->created()) {
        if (auto ec = discard_state(state_path, output)) {
            std::cerr << "Error: Cannot remove stale resume state " << state_path.string() << ": "
                      << ec.message() << std::endl;
            return std::unexpected(ec);
        }
    }

    core::BlobTransfer transfer(client);

    core::TransferRequest request;
    request.url = args.url;
    request.headers = args.headers;
    request.destination = &*destination;
    request.chunk_size = args.chunk_size;
    request.max_workers = args.workers;
    request.adaptive_chunk_size = args.adaptive;
    request.resume = args.resume;
    request.resume_state_path = state_path;

    const auto start_time = chrono::steady_clock::now();

    std::mutex bar_mutex;
    ProgressBar bar(std::cout, "Downloading");
    if (!args.quiet) {
        request.on_progress = [&](const core::TransferProgress& p) {
            std::lock_guard<std::mutex> lock(bar_mutex);
            const auto elapsed = chrono::duration<double>(chrono::steady_clock::now() - start_time).count();
            const auto fetched = p.completed_bytes - p.resumed_bytes;
            const auto speed = elapsed > 0.0 ? static_cast<std::uint64_t>(static_cast<double>(fetched) / elapsed) : 0;
            bar.update(p.completed_bytes, p.total_bytes, speed);
        };
    }

    if (args.verbose) {
        std::cout << "Downloading " << args.url << " to " << output << "..." << std::endl;
    }

    auto result = transfer.run(request);
    destination->close();

    if (!result) {
        if (!args.quiet) bar.clear();
        std::cerr << "Error: " << result.error().message() << std::endl;
        if (args.resume) {
            std::cerr << "Progress saved to " << request.resume_state_path.string()
                      << ", rerun with --resume to continue" << std::endl;
        }
        return std::unexpected(result.error().code);
    }

    if (!args.quiet) bar.finish();

    const auto seconds = chrono::duration<double>(chrono::steady_clock::now() - start_time).count();
    const double megabytes = static_cast<double>(result->content_size) / static_cast<double>(core::MiB);
    const double speed = seconds > 0.0 ? megabytes / seconds : 0.0;

    std::cout << "\nDownload Results:\n";
    std::cout << std::format("URL: {}\n", args.url);
    std::cout << std::format("File Size: {:.2f} MB\n", megabytes);
    std::cout << std::format("Download Time: {:.2f} seconds\n", seconds);
    std::cout << std::format("Speed: {:.2f} MB/s\n", speed);
    std::cout << std::format("Range Requests Supported: {}\n", result->ranged ? "yes" : "no");
    std::cout << std::format("Download Method: {}\n", result->ranged ? "Parallel" : "Sequential");
    if (result->resumed_chunks > 0) {
        std::cout << std::format("Resumed Chunks: {} of {}\n", result->resumed_chunks, result->total_chunks);
    }
    std::cout << "\nFile successfully downloaded to " << output << std::endl;
    return 0;
}

CliResult info(const CliArgs& args) {
    auto session = make_session(args);
    core::ContentProbe probe(session);

    auto result = probe.probe(args.url, args.headers);
    if (!result) {
        std::cerr << "Error: " << result.error().message() << std::endl;
        return std::unexpected(result.error().code);
    }

    std::cout << "URL: " << args.url << std::endl;
    std::cout << "Content-Length: " << result->content_size << " ("
              << ProgressBar::format_bytes(result->content_size) << ")" << std::endl;
    std::cout << "Accepts-Ranges: " << (result->supports_ranges ? "yes" : "no") << std::endl;
    return 0;
}

void print_help(std::string_view program_name) {
    std::cout << "blobxfer " << blobxfer::version.to_string() << " - resumable parallel blob download\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL>\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable verbose output\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar)\n";
    std::cout << "  -o, --output <FILE>     Save to specified file (default: derived from URL)\n";
    std::cout << "  -w, --workers <N>       Maximum number of parallel workers (default: 3)\n";
    std::cout << "  -c, --chunk-size <SIZE> Chunk size, e.g. 512K, 16M (default: 2M)\n";
    std::cout << "      --adaptive          Derive chunk size from the object size\n";
    std::cout << "  -r, --resume            Resume an interrupted download\n";
    std::cout << "      --state-file <FILE> Resume state location (default: <output>.xferstate)\n";
    std::cout << "  -H, --header <H>        Extra request header, 'Name: value' (repeatable)\n";
    std::cout << "      --no-verify-ssl     Disable SSL certificate verification\n";
    std::cout << "  -i, --info              Show size and range support without downloading\n";
    std::cout << "\n";
    std::cout << "ENVIRONMENT:\n";
    std::cout << "  BLOBXFER_LOG_LEVEL      trace, debug, info, warn, error, critical, off\n";
    std::cout << "  BLOBXFER_LOG_FILE       Daily-rotated log file (e.g. $HOME/.logs/blobxfer.log)\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/file.zip\n";
    std::cout << "  " << program_name << " -o data.parquet -w 8 -c 16M https://example.com/data.parquet\n";
    std::cout << "  " << program_name << " --resume -H 'Authorization: Bearer $TOKEN' https://example.com/big.bin\n";
}

void print_version() {
    std::cout << "blobxfer " << blobxfer::version.to_string() << std::endl;
    std::cout << "Built with C++23, libcurl, nlohmann/json, spdlog\n";
}

} // namespace blobxfer::cli
