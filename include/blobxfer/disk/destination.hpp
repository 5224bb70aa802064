// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <cstdint>
#include <system_error>
#include <vector>

namespace blobxfer::disk {

// Seekable, writable byte sink with a single cursor. Not thread-safe:
// callers serialize each seek + write pair themselves.
class Destination {
public:
    virtual ~Destination() = default;

    [[nodiscard]] virtual std::error_code seek(std::uint64_t offset) noexcept = 0;

    // Write at the cursor and advance it
    [[nodiscard]] virtual std::error_code write(const void* data, std::size_t size) noexcept = 0;

    [[nodiscard]] virtual std::error_code flush() noexcept { return {}; }

    // Cut or extend the sink to exactly `size` bytes
    [[nodiscard]] virtual std::error_code set_size(std::uint64_t size) noexcept {
        (void)size;
        return {};
    }
};

// Growable in-memory destination
class MemoryDestination final : public Destination {
public:
    MemoryDestination() = default;

    [[nodiscard]] std::error_code seek(std::uint64_t offset) noexcept override;
    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept override;
    [[nodiscard]] std::error_code set_size(std::uint64_t size) noexcept override;

    [[nodiscard]] const std::vector<std::byte>& data() const noexcept { return data_; }
    [[nodiscard]] std::uint64_t position() const noexcept { return position_; }

    [[nodiscard]] std::vector<std::byte> release() noexcept;

private:
    std::vector<std::byte> data_;
    std::uint64_t position_{0};
};

} // namespace blobxfer::disk
