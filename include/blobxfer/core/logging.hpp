// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace blobxfer::core {

struct LogConfig {
    spdlog::level::level_enum level{spdlog::level::info};
    std::string file_path;           // Daily-rotated log file; empty disables it
    std::uint16_t retention_days{7};
    bool console{true};

    // BLOBXFER_LOG_LEVEL (trace, debug, info, warn, error, critical, off)
    // BLOBXFER_LOG_FILE  (path, "$HOME" and "~" are expanded)
    [[nodiscard]] static LogConfig from_env();
};

// Replace the "blobxfer" logger with one built from `config`
void init_logging(const LogConfig& config);

// The "blobxfer" logger; logs to stderr at info level until init_logging is called
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

// "$HOME/x" and "~/x" with the home directory substituted
[[nodiscard]] std::string expand_home(std::string_view path);

} // namespace blobxfer::core
