// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/range_fetcher.hpp>
#include <ferry/disk/file_writer.hpp>
#include <ferry/disk/segment_store.hpp>
#include <spdlog/spdlog.h>

namespace ferry::core {

std::expected<void, DownloadError>
RangeFetcher::fetch(const std::string& url, const Chunk& chunk, const ByteCounter& on_bytes) noexcept {
    const auto fail = [&chunk](DownloadError inner) {
        spdlog::debug("chunk {}: failed: {}", chunk.index, inner.message());
        return std::unexpected(DownloadError::chunk(chunk.index, std::move(inner)));
    };

    auto writer = disk::FileWriter::open(chunk.path.string());
    if (!writer) {
        return fail(DownloadError{writer.error(), chunk.path.string()});
    }

    spdlog::debug("chunk {}: bytes={}-{}", chunk.index, chunk.start, chunk.end);

    const std::uint64_t expected = chunk.length();
    BodySink sink = [&](const char* data, std::size_t size) -> std::error_code {
        // A server that ignores Range sends the whole resource
        if (writer->bytes_written() + size > expected) {
            return make_error_code(DownloadErrc::invalid_range);
        }
        if (auto ec = writer->write(data, size)) {
            return ec;
        }
        if (on_bytes) on_bytes(size);
        return {};
    };

    auto response = session_.get(url, sink, ByteRange{chunk.start, chunk.end});
    if (!response) {
        DownloadError err = response.error();
        if (err.code == DownloadErrc::invalid_range && err.detail.empty()) {
            err.detail = "more than " + std::to_string(expected) + " bytes received";
        }
        return fail(std::move(err));
    }

    if (writer->bytes_written() != expected) {
        return fail(DownloadError{make_error_code(DownloadErrc::short_body),
                                  std::to_string(writer->bytes_written()) + "/" +
                                  std::to_string(expected) + " bytes"});
    }

    if (auto ec = writer->flush()) {
        return fail(DownloadError{ec, chunk.path.string()});
    }
    if (auto ec = writer->close()) {
        return fail(DownloadError{ec, chunk.path.string()});
    }
    if (auto ec = disk::SegmentStore::mark_complete(chunk)) {
        return fail(DownloadError{ec, chunk.marker_path.string()});
    }

    spdlog::debug("chunk {}: complete ({} bytes)", chunk.index, expected);
    return {};
}

} // namespace ferry::core
