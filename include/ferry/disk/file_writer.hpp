// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace ferry::disk {

// Owning POSIX file descriptor for sequential writes
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    // Non-copyable, movable
    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    // Create or truncate `path` for writing
    [[nodiscard]] static std::expected<FileWriter, std::error_code>
    open(std::string_view path) noexcept;

    // Set the file length to exactly `size` bytes (sparse where supported)
    [[nodiscard]] std::error_code pre_allocate(std::uint64_t size) noexcept;

    // Append at the current position
    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept;

    // Push written data to the device
    [[nodiscard]] std::error_code flush() noexcept;

    // Close the descriptor; errors from close(2) are reported
    [[nodiscard]] std::error_code close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] std::uint64_t bytes_written() const noexcept { return written_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    int fd_{-1};
    std::uint64_t written_{0};
    std::string path_;
};

} // namespace ferry::disk
