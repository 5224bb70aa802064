// Copyright (c) 2026 changcheng967. All rights reserved.

#include <blobxfer/disk/file_destination.hpp>
#include <cerrno>
#include <filesystem>
#include <new>

#ifndef _WIN32
#include <sys/types.h>
#include <unistd.h>
#endif

namespace blobxfer::disk {

namespace {

int seek64(std::FILE* f, std::uint64_t offset) noexcept {
#ifdef _WIN32
    return _fseeki64(f, static_cast<__int64>(offset), SEEK_SET);
#else
    return fseeko(f, static_cast<off_t>(offset), SEEK_SET);
#endif
}

} // namespace

std::error_code from_errno(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case ENOENT:  return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:   return make_error_code(DiskErrc::access_denied);
        case ENOSPC:  return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR: return make_error_code(DiskErrc::invalid_path);
        default:      return make_error_code(fallback);
    }
}

//=============================================================================
// FileDestination
//=============================================================================

std::expected<FileDestination, std::error_code>
FileDestination::open(std::string_view path, OpenMode mode) noexcept {
    try {
        FileDestination dest;
        dest.path_ = path;

        std::FILE* f = nullptr;
        if (mode == OpenMode::keep) {
            // "r+b" keeps existing bytes but fails when the file is missing
            f = std::fopen(dest.path_.c_str(), "r+b");
            if (!f && errno == ENOENT) {
                f = std::fopen(dest.path_.c_str(), "w+b");
                dest.created_ = true;
            }
        } else {
            std::error_code ec;
            dest.created_ = !std::filesystem::exists(dest.path_, ec);
            f = std::fopen(dest.path_.c_str(), "wb");
        }

        if (!f) {
            return std::unexpected(from_errno(errno, DiskErrc::handle_invalid));
        }

        dest.file_.reset(f);
        return dest;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }
}

std::error_code FileDestination::seek(std::uint64_t offset) noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (seek64(file_.get(), offset) != 0) {
        return from_errno(errno, DiskErrc::seek_error);
    }
    return {};
}

std::error_code FileDestination::write(const void* data, std::size_t size) noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (size == 0) {
        return {};
    }
    if (std::fwrite(data, 1, size, file_.get()) != size) {
        return from_errno(errno, DiskErrc::write_error);
    }
    return {};
}

std::error_code FileDestination::flush() noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (std::fflush(file_.get()) != 0) {
        return from_errno(errno, DiskErrc::flush_error);
    }
    return {};
}

std::error_code FileDestination::set_size(std::uint64_t size) noexcept {
    if (auto ec = flush()) {
        return ec;
    }

    std::error_code ec;
    std::filesystem::resize_file(path_, size, ec);
    if (ec) {
        return make_error_code(DiskErrc::write_error);
    }
    return {};
}

void FileDestination::close() noexcept {
    if (file_) {
        (void)flush();
        file_.reset();
    }
}

} // namespace blobxfer::disk
