// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <compare>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blobxfer::core {

// Inclusive byte interval [start, end], 0-indexed
struct ByteRange {
    std::uint64_t start{0};
    std::uint64_t end{0};

    [[nodiscard]] constexpr std::uint64_t size() const noexcept { return end - start + 1; }

    constexpr auto operator<=>(const ByteRange&) const = default;

    // "start-end"
    [[nodiscard]] std::string to_string() const;

    // Value for a Range request header: "bytes=start-end"
    [[nodiscard]] std::string header_value() const;
};

// Parsed "Content-Range: bytes <start>-<end>/<total>" header.
// total is empty when the server sends "*".
struct ContentRange {
    ByteRange range;
    std::optional<std::uint64_t> total;
};

// Partition [start, end] into inclusive sub-ranges of `step` bytes.
// The final range absorbs the remainder, so it may be longer than `step`.
// Returns nothing when start > end or step == 0.
//
//   split_range(0, 10, 3) -> (0,2) (3,5) (6,8) (9,10)
[[nodiscard]] std::vector<ByteRange> split_range(std::uint64_t start,
                                                 std::uint64_t end,
                                                 std::uint64_t step);

[[nodiscard]] std::optional<ContentRange> parse_content_range(std::string_view value) noexcept;

[[nodiscard]] std::optional<std::uint64_t> parse_uint(std::string_view value) noexcept;

} // namespace blobxfer::core
