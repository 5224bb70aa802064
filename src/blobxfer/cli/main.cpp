// Copyright (c) 2026 changcheng967. All rights reserved.

#include <blobxfer/cli/commands.hpp>
#include <blobxfer/core/http_session.hpp>
#include <blobxfer/core/logging.hpp>
#include <exception>
#include <iostream>

using namespace blobxfer::cli;

int main(int argc, char* argv[]) {
    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }

    if (args.version) {
        print_version();
        return 0;
    }

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    try {
        auto log_config = blobxfer::core::LogConfig::from_env();
        if (args.verbose) {
            log_config.level = spdlog::level::debug;
        } else if (args.quiet && log_config.level < spdlog::level::warn) {
            log_config.level = spdlog::level::warn;
        }
        blobxfer::core::init_logging(log_config);
    } catch (const std::exception& e) {
        std::cerr << "Warning: logging setup failed: " << e.what() << std::endl;
    }

    blobxfer::core::HttpSession::global_init();

    CliResult result = args.info ? info(args) : download(args);

    blobxfer::core::HttpSession::global_cleanup();

    return result ? *result : 1;
}
