// Copyright (c) 2026 changcheng967. All rights reserved.

#include <blobxfer/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <format>
#include <ostream>

namespace blobxfer::cli {

namespace {

constexpr int BAR_WIDTH = 30;

} // namespace

ProgressBar::ProgressBar(std::ostream& out, std::string_view label)
    : out_(out)
    , label_(label) {}

void ProgressBar::update(std::uint64_t current, std::uint64_t total, std::uint64_t speed_bps) {
    current_ = current;
    total_ = total;
    if (total == 0) return;

    double percent = static_cast<double>(current) * 100.0 / static_cast<double>(total);
    percent = std::clamp(percent, 0.0, 100.0);

    const int whole = static_cast<int>(percent);
    if (whole == last_percent_) return;
    last_percent_ = whole;

    std::string line = "\r";
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    line += render_bar(percent);
    line += std::format(" {:3}% ({}/{})", whole, format_bytes(current), format_bytes(total));

    if (speed_bps > 0) {
        line += " @ ";
        line += format_speed(speed_bps);

        if (current < total) {
            line += " ETA: ";
            line += format_time((total - current) / speed_bps);
        }
    }

    // Clear leftovers of a longer previous line
    line += std::string(10, ' ');
    out_ << line << std::flush;
}

void ProgressBar::finish() {
    if (finished_) return;
    finished_ = true;
    last_percent_ = -1;
    update(total_, total_);
    out_ << '\n' << std::flush;
}

void ProgressBar::clear() {
    out_ << '\r' << std::string(80, ' ') << '\r' << std::flush;
}

std::string ProgressBar::render_bar(double percent) {
    const int filled = static_cast<int>(std::round(BAR_WIDTH * percent / 100.0));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar += '>';
    bar.append(static_cast<std::size_t>(BAR_WIDTH - filled), ' ');
    bar += ']';
    return bar;
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    const auto value = static_cast<double>(bytes);
    if (bytes >= TB) return std::format("{:.2f} TB", value / TB);
    if (bytes >= GB) return std::format("{:.2f} GB", value / GB);
    if (bytes >= MB) return std::format("{:.1f} MB", value / MB);
    if (bytes >= KB) return std::format("{:.0f} KB", value / KB);
    return std::format("{} B", bytes);
}

std::string ProgressBar::format_speed(std::uint64_t bps) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;

    const auto value = static_cast<double>(bps);
    if (bps >= GB) return std::format("{:.1f} GB/s", value / GB);
    if (bps >= MB) return std::format("{:.1f} MB/s", value / MB);
    if (bps >= KB) return std::format("{:.1f} KB/s", value / KB);
    return std::format("{} B/s", bps);
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    const std::uint64_t hours = seconds / 3600;
    const std::uint64_t minutes = (seconds % 3600) / 60;
    const std::uint64_t secs = seconds % 60;

    if (hours > 0) return std::format("{}h {:02}m {}s", hours, minutes, secs);
    if (minutes > 0) return std::format("{}m {}s", minutes, secs);
    return std::format("{}s", secs);
}

} // namespace blobxfer::cli
