// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

namespace blobxfer::cli {

// Single-line progress bar redrawn in place with '\r'
class ProgressBar {
public:
    explicit ProgressBar(std::ostream& out, std::string_view label = {});

    // Redraws at most once per whole percent
    void update(std::uint64_t current, std::uint64_t total, std::uint64_t speed_bps = 0);

    void finish();
    void clear();

    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);
    [[nodiscard]] static std::string format_speed(std::uint64_t bps);
    [[nodiscard]] static std::string format_time(std::uint64_t seconds);

private:
    [[nodiscard]] static std::string render_bar(double percent);

    std::ostream& out_;
    std::string label_;
    std::uint64_t current_{0};
    std::uint64_t total_{0};
    int last_percent_{-1};
    bool finished_{false};
};

} // namespace blobxfer::cli
