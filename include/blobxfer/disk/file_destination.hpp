// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <blobxfer/disk/destination.hpp>
#include <blobxfer/disk/error.hpp>
#include <cstdio>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace blobxfer::disk {

enum class OpenMode : std::uint8_t {
    truncate,  // Create or empty the file
    keep       // Create if missing, keep existing bytes (resume)
};

// Destination backed by a file on disk
class FileDestination final : public Destination {
public:
    [[nodiscard]] static std::expected<FileDestination, std::error_code>
    open(std::string_view path, OpenMode mode = OpenMode::truncate) noexcept;

    // Non-copyable, movable
    FileDestination(const FileDestination&) = delete;
    FileDestination& operator=(const FileDestination&) = delete;
    FileDestination(FileDestination&&) noexcept = default;
    FileDestination& operator=(FileDestination&&) noexcept = default;
    ~FileDestination() override = default;

    [[nodiscard]] std::error_code seek(std::uint64_t offset) noexcept override;
    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept override;
    [[nodiscard]] std::error_code flush() noexcept override;
    [[nodiscard]] std::error_code set_size(std::uint64_t size) noexcept override;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return file_ != nullptr; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    // True when open() found no file and made a new one
    [[nodiscard]] bool created() const noexcept { return created_; }

private:
    struct FileCloser {
        void operator()(std::FILE* f) const noexcept { std::fclose(f); }
    };

    FileDestination() = default;

    std::unique_ptr<std::FILE, FileCloser> file_;
    std::string path_;
    bool created_{false};
};

// Map errno to a DiskErrc, falling back to `fallback`
[[nodiscard]] std::error_code from_errno(int err, DiskErrc fallback) noexcept;

} // namespace blobxfer::disk
