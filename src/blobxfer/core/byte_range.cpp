// Copyright (c) 2026 changcheng967. All rights reserved.

#include <blobxfer/core/byte_range.hpp>
#include <charconv>
#include <format>

namespace blobxfer::core {

namespace {

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) {
        s.remove_suffix(1);
    }
    return s;
}

} // namespace

std::string ByteRange::to_string() const {
    return std::format("{}-{}", start, end);
}

std::string ByteRange::header_value() const {
    return std::format("bytes={}-{}", start, end);
}

std::vector<ByteRange> split_range(std::uint64_t start,
                                   std::uint64_t end,
                                   std::uint64_t step) {
    std::vector<ByteRange> ranges;
    if (start > end || step == 0) {
        return ranges;
    }

    ranges.reserve(static_cast<std::size_t>((end - start) / step + 1));

    // Block boundaries are start, start + step, ... strictly below end.
    // Every boundary but the last opens a full block; the last one runs to end.
    std::uint64_t block = start;
    while (end - block > step) {
        ranges.push_back({block, block + step - 1});
        block += step;
    }
    ranges.push_back({block, end});
    return ranges;
}

std::optional<std::uint64_t> parse_uint(std::string_view value) noexcept {
    value = trim(value);
    if (value.empty()) {
        return std::nullopt;
    }

    std::uint64_t result = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
        return std::nullopt;
    }
    return result;
}

std::optional<ContentRange> parse_content_range(std::string_view value) noexcept {
    value = trim(value);

    constexpr std::string_view unit = "bytes ";
    if (!value.starts_with(unit)) {
        return std::nullopt;
    }
    value.remove_prefix(unit.size());

    auto dash = value.find('-');
    auto slash = value.find('/');
    if (dash == std::string_view::npos || slash == std::string_view::npos || dash > slash) {
        return std::nullopt;
    }

    auto start = parse_uint(value.substr(0, dash));
    auto end = parse_uint(value.substr(dash + 1, slash - dash - 1));
    if (!start || !end || *start > *end) {
        return std::nullopt;
    }

    ContentRange result{{*start, *end}, std::nullopt};

    auto total_str = trim(value.substr(slash + 1));
    if (total_str != "*") {
        auto total = parse_uint(total_str);
        if (!total || *total <= *end) {
            return std::nullopt;
        }
        result.total = *total;
    }
    return result;
}

} // namespace blobxfer::core
