// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/disk/file_writer.hpp>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <utility>

namespace ferry::disk {

std::error_code errno_to_error_code(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case ENOENT:        return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:         return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:        return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:        return make_error_code(DiskErrc::invalid_path);
        case EEXIST:        return make_error_code(DiskErrc::file_exists);
        case EBADF:         return make_error_code(DiskErrc::handle_invalid);
        default:            return make_error_code(fallback);
    }
}

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : fd_(other.fd_)
    , written_(other.written_)
    , path_(std::move(other.path_)) {
    other.fd_ = -1;
}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = other.fd_;
        written_ = other.written_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

std::expected<FileWriter, std::error_code> FileWriter::open(std::string_view path) noexcept {
    FileWriter writer;
    writer.path_ = path;

    writer.fd_ = ::open(writer.path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (writer.fd_ < 0) {
        return std::unexpected(errno_to_error_code(errno, DiskErrc::write_error));
    }
    return writer;
}

std::error_code FileWriter::pre_allocate(std::uint64_t size) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    // ftruncate gives the exact length; blocks are reserved lazily
    if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
        return errno_to_error_code(errno, DiskErrc::allocation_failed);
    }
    return {};
}

std::error_code FileWriter::write(const void* data, std::size_t size) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* cursor = static_cast<const char*>(data);
    std::size_t remaining = size;
    while (remaining > 0) {
        ssize_t n = ::write(fd_, cursor, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_to_error_code(errno, DiskErrc::write_error);
        }
        cursor += n;
        remaining -= static_cast<std::size_t>(n);
    }

    written_ += size;
    return {};
}

std::error_code FileWriter::flush() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fdatasync(fd_) != 0) {
        return errno_to_error_code(errno, DiskErrc::write_error);
    }
    return {};
}

std::error_code FileWriter::close() noexcept {
    if (fd_ < 0) {
        return {};
    }

    int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
        return errno_to_error_code(errno, DiskErrc::write_error);
    }
    return {};
}

} // namespace ferry::disk
