// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/download_engine.hpp>
#include <ferry/core/range_fetcher.hpp>
#include <ferry/disk/file_writer.hpp>
#include <ferry/disk/merger.hpp>
#include <ferry/disk/segment_store.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>
#include <optional>

namespace ferry::core {

namespace asio = boost::asio;

//=============================================================================
// DownloadEngine
//=============================================================================

std::expected<void, DownloadError> DownloadEngine::run(DownloadTask task) noexcept {
    downloaded_.store(0, std::memory_order_relaxed);
    last_emit_bytes_ = 0;
    last_emit_ = std::chrono::steady_clock::now();
    total_ = task.total_size;

    if (task.chunk_size == 0) {
        task.chunk_size = config_.chunk_size;
    }
    if (task.url.empty()) {
        return fail(DownloadError{make_error_code(DownloadErrc::invalid_url)});
    }

    // A stated size implies range support; per-chunk status checks validate it
    if (task.total_size > 0) {
        spdlog::info("{}: {} bytes (given), segmented", task.url, task.total_size);
        return run_segmented(task);
    }

    state_.store(DownloadState::detecting, std::memory_order_release);
    HttpSession session;
    auto head = session.head(task.url);
    if (!head) {
        return fail(head.error());
    }
    if (!head->content_length) {
        return fail(DownloadError{make_error_code(DownloadErrc::missing_content_length), task.url});
    }

    task.total_size = *head->content_length;
    total_ = task.total_size;
    spdlog::info("{}: {} bytes, ranges {}", task.url, task.total_size,
                 head->accepts_ranges ? "supported" : "not supported");

    if (!head->accepts_ranges) {
        return run_whole_file(task);
    }
    return run_segmented(task);
}

std::expected<void, DownloadError> DownloadEngine::run_whole_file(const DownloadTask& task) noexcept {
    state_.store(DownloadState::whole_file, std::memory_order_release);
    emit(event::Started{task.total_size});

    auto writer = disk::FileWriter::open(task.output.string());
    if (!writer) {
        return fail(DownloadError{writer.error(), task.output.string()});
    }

    BodySink sink = [&](const char* data, std::size_t size) -> std::error_code {
        if (auto ec = writer->write(data, size)) {
            return ec;
        }
        add_bytes(size);
        return {};
    };

    HttpSession session;
    auto response = session.get(task.url, sink);
    if (!response) {
        return fail(response.error());
    }
    if (auto ec = writer->flush()) {
        return fail(DownloadError{ec, task.output.string()});
    }
    if (auto ec = writer->close()) {
        return fail(DownloadError{ec, task.output.string()});
    }

    emit_progress(true);
    state_.store(DownloadState::done, std::memory_order_release);
    spdlog::info("Saved {} ({} bytes)", task.output.string(), downloaded());
    emit(event::Completed{});
    return {};
}

std::expected<void, DownloadError> DownloadEngine::run_segmented(const DownloadTask& task) noexcept {
    state_.store(DownloadState::segmented, std::memory_order_release);

    std::vector<Chunk> chunks;
    try {
        chunks = plan_chunks(task);
    } catch (const std::bad_alloc&) {
        return fail(DownloadError{make_error_code(disk::DiskErrc::allocation_failed), "chunk plan"});
    }

    if (auto ec = disk::SegmentStore::ensure(chunks)) {
        return fail(DownloadError{ec, task.output.string()});
    }

    emit(event::Started{task.total_size});

    std::vector<Chunk> pending;
    std::uint64_t skipped_bytes = 0;
    for (const auto& chunk : chunks) {
        if (disk::SegmentStore::is_complete(chunk)) {
            skipped_bytes += chunk.length();
        } else {
            pending.push_back(chunk);
        }
    }

    spdlog::info("{} chunks of {} bytes, {} pending, {} already complete",
                 chunks.size(), task.chunk_size, pending.size(), chunks.size() - pending.size());
    if (skipped_bytes > 0) {
        add_bytes(skipped_bytes);
    }

    if (auto fetched = fetch_all(task.url, pending); !fetched) {
        return fail(fetched.error());
    }
    emit_progress(true);

    state_.store(DownloadState::merging, std::memory_order_release);
    emit(event::Merging{});

    std::vector<std::filesystem::path> parts;
    parts.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        parts.push_back(chunk.path);
    }

    if (auto ec = disk::merge_files(parts, task.output)) {
        DownloadError err(make_error_code(DownloadErrc::merge_failed), ec.message());
        return fail(std::move(err));
    }

    if (config_.remove_temp_files) {
        state_.store(DownloadState::cleanup, std::memory_order_release);
        if (auto ec = disk::SegmentStore::remove(chunks)) {
            // Output is complete; leftover part files are only reported
            spdlog::warn("Cleanup of {} incomplete: {}", task.output.string(), ec.message());
        }
    }

    state_.store(DownloadState::done, std::memory_order_release);
    spdlog::info("Saved {} ({} bytes)", task.output.string(), task.total_size);
    emit(event::Completed{});
    return {};
}

std::expected<void, DownloadError>
DownloadEngine::fetch_all(const std::string& url, const std::vector<Chunk>& pending) noexcept {
    if (pending.empty()) {
        return {};
    }

    const auto workers = std::max<std::size_t>(
        1, std::min<std::size_t>(config_.max_concurrent, pending.size()));

    // One slot per chunk; each task writes only its own slot
    std::vector<std::optional<DownloadError>> results(pending.size());

    try {
        asio::thread_pool pool(workers);
        for (std::size_t i = 0; i < pending.size(); ++i) {
            asio::post(pool, [this, &url, &pending, &results, i] {
                RangeFetcher fetcher;
                auto fetched = fetcher.fetch(url, pending[i],
                                             [this](std::uint64_t bytes) { add_bytes(bytes); });
                if (!fetched) {
                    results[i] = fetched.error();
                }
            });
        }
        pool.join();
    } catch (const std::system_error& e) {
        // Thread creation failed
        return std::unexpected(DownloadError{e.code(), "worker pool"});
    }

    for (auto& result : results) {
        if (result) {
            return std::unexpected(std::move(*result));
        }
    }
    return {};
}

//=============================================================================
// Progress
//=============================================================================

void DownloadEngine::add_bytes(std::uint64_t bytes) noexcept {
    downloaded_.fetch_add(bytes, std::memory_order_relaxed);
    emit_progress(false);
}

void DownloadEngine::emit(const ProgressEvent& ev) noexcept {
    ProgressCallback cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = callback_;
    }
    deliver(cb, ev);
}

void DownloadEngine::deliver(const ProgressCallback& cb, const ProgressEvent& ev) noexcept {
    if (!cb) {
        return;
    }
    std::lock_guard<std::mutex> lock(delivery_mutex_);
    try {
        cb(ev);
    } catch (const std::exception& e) {
        spdlog::warn("Progress callback threw: {}", e.what());
    } catch (...) {
        spdlog::warn("Progress callback threw a non-standard exception");
    }
}

void DownloadEngine::emit_progress(bool force) noexcept {
    ProgressCallback cb;
    event::Progress progress;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);

        auto now = std::chrono::steady_clock::now();
        auto elapsed = now - last_emit_;
        if (!force && elapsed < PROGRESS_INTERVAL) {
            return;
        }

        progress.downloaded = downloaded_.load(std::memory_order_relaxed);
        progress.total = total_;

        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
        if (ms > 0 && progress.downloaded >= last_emit_bytes_) {
            progress.speed = (progress.downloaded - last_emit_bytes_) * 1000 / static_cast<std::uint64_t>(ms);
        }

        last_emit_ = now;
        last_emit_bytes_ = progress.downloaded;
        cb = callback_;
    }
    deliver(cb, progress);
}

std::expected<void, DownloadError> DownloadEngine::fail(DownloadError err) noexcept {
    state_.store(DownloadState::failed, std::memory_order_release);
    auto text = err.message();
    spdlog::error("Download failed: {}", text);
    emit(event::Error{std::move(text)});
    return std::unexpected(std::move(err));
}

} // namespace ferry::core
