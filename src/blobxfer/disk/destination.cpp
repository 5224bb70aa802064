// Copyright (c) 2026 changcheng967. All rights reserved.

#include <blobxfer/disk/destination.hpp>
#include <blobxfer/disk/error.hpp>
#include <cstring>
#include <limits>
#include <new>

namespace blobxfer::disk {

//=============================================================================
// MemoryDestination
//=============================================================================

std::error_code MemoryDestination::seek(std::uint64_t offset) noexcept {
    if (offset > std::numeric_limits<std::size_t>::max()) {
        return make_error_code(DiskErrc::seek_error);
    }
    position_ = offset;
    return {};
}

std::error_code MemoryDestination::write(const void* data, std::size_t size) noexcept {
    if (size == 0) {
        return {};
    }

    const auto end = static_cast<std::size_t>(position_) + size;
    try {
        if (end > data_.size()) {
            data_.resize(end);
        }
    } catch (const std::bad_alloc&) {
        return make_error_code(DiskErrc::disk_full);
    }

    std::memcpy(data_.data() + position_, data, size);
    position_ = end;
    return {};
}

std::error_code MemoryDestination::set_size(std::uint64_t size) noexcept {
    try {
        data_.resize(static_cast<std::size_t>(size));
    } catch (const std::bad_alloc&) {
        return make_error_code(DiskErrc::disk_full);
    }
    return {};
}

std::vector<std::byte> MemoryDestination::release() noexcept {
    position_ = 0;
    return std::move(data_);
}

} // namespace blobxfer::disk
