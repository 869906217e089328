// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/disk/merger.hpp>
#include <ferry/disk/file_writer.hpp>
#include <ferry/core/config.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <memory>
#include <new>
#include <fcntl.h>
#include <unistd.h>

namespace ferry::disk {

namespace {

// RAII read-only descriptor
struct ReadHandle {
    int fd = -1;

    explicit ReadHandle(const std::filesystem::path& path)
        : fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC)) {}
    ~ReadHandle() { if (fd >= 0) ::close(fd); }

    ReadHandle(const ReadHandle&) = delete;
    ReadHandle& operator=(const ReadHandle&) = delete;
};

std::error_code append_file(const std::filesystem::path& part, FileWriter& out, char* buffer) noexcept {
    ReadHandle in(part);
    if (in.fd < 0) {
        return errno_to_error_code(errno, DiskErrc::read_error);
    }

    ::posix_fadvise(in.fd, 0, 0, POSIX_FADV_SEQUENTIAL);

    while (true) {
        ssize_t n = ::read(in.fd, buffer, core::MERGE_BUFFER_SIZE);
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_to_error_code(errno, DiskErrc::read_error);
        }
        if (n == 0) {
            return {};
        }
        if (auto ec = out.write(buffer, static_cast<std::size_t>(n))) {
            return ec;
        }
    }
}

} // namespace

std::error_code merge_files(const std::vector<std::filesystem::path>& parts,
                            const std::filesystem::path& output) noexcept {
    auto out = FileWriter::open(output.string());
    if (!out) {
        return out.error();
    }

    std::unique_ptr<char[]> buffer(new (std::nothrow) char[core::MERGE_BUFFER_SIZE]);
    if (!buffer) {
        return make_error_code(DiskErrc::allocation_failed);
    }

    for (const auto& part : parts) {
        if (auto ec = append_file(part, *out, buffer.get())) {
            spdlog::error("Merge failed on {}: {}", part.string(), ec.message());
            return ec;
        }
    }

    spdlog::debug("Merged {} part(s) into {} ({} bytes)", parts.size(), output.string(), out->bytes_written());

    if (auto ec = out->flush()) {
        return ec;
    }
    return out->close();
}

} // namespace ferry::disk
