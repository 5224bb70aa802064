// Copyright (c) 2026 changcheng967. All rights reserved.

#include <blobxfer/core/logging.hpp>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <vector>

namespace blobxfer::core {

namespace {

constexpr const char* LOGGER_NAME = "blobxfer";
constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v";

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<spdlog::logger> make_default_logger() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto log = std::make_shared<spdlog::logger>(LOGGER_NAME, std::move(sink));
    log->set_pattern(LOG_PATTERN);
    log->set_level(spdlog::level::info);
    return log;
}

} // namespace

LogConfig LogConfig::from_env() {
    LogConfig config;

    if (const char* level = std::getenv("BLOBXFER_LOG_LEVEL"); level && *level) {
        config.level = spdlog::level::from_str(level);
    }
    if (const char* file = std::getenv("BLOBXFER_LOG_FILE"); file && *file) {
        config.file_path = expand_home(file);
    }
    return config;
}

std::string expand_home(std::string_view path) {
    const char* home = std::getenv("HOME");
    if (!home) {
        return std::string(path);
    }

    if (path.starts_with("$HOME")) {
        return std::string(home) + std::string(path.substr(5));
    }
    if (path.starts_with("~/") || path == "~") {
        return std::string(home) + std::string(path.substr(1));
    }
    return std::string(path);
}

void init_logging(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    if (!config.file_path.empty()) {
        std::filesystem::path p(config.file_path);
        std::error_code ec;
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path(), ec);
        }
        if (!ec) {
            // Rotate at midnight, keep `retention_days` files
            sinks.push_back(std::make_shared<spdlog::sinks::daily_file_sink_mt>(
                config.file_path, 0, 0, false, config.retention_days));
        }
    }

    auto log = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    log->set_pattern(LOG_PATTERN);
    log->set_level(config.level);
    log->flush_on(spdlog::level::warn);

    std::lock_guard<std::mutex> lock(logger_mutex());
    spdlog::drop(LOGGER_NAME);
    spdlog::register_logger(log);
}

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(logger_mutex());
    auto log = spdlog::get(LOGGER_NAME);
    if (!log) {
        log = make_default_logger();
        spdlog::register_logger(log);
    }
    return log;
}

} // namespace blobxfer::core
