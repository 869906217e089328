// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/chunk.hpp>
#include <ferry/core/config.hpp>
#include <ferry/core/error.hpp>
#include <ferry/core/http_session.hpp>
#include <ferry/core/progress.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <mutex>
#include <string>
#include <vector>

namespace ferry::core {

// Orchestration state
enum class DownloadState : std::uint8_t {
    idle,        // Not started
    detecting,   // HEAD request for size and range support
    whole_file,  // Single unranged GET straight to the output
    segmented,   // Concurrent range GETs into part files
    merging,     // Concatenating part files
    cleanup,     // Removing part files and markers
    done,
    failed
};

// Engine configuration
struct EngineConfig {
    std::uint64_t chunk_size{DEFAULT_CHUNK_SIZE};        // Used when the task leaves it 0
    std::uint32_t max_concurrent{MAX_CONCURRENT_CHUNKS}; // In-flight chunk fetches
    bool remove_temp_files{true};                        // Delete part files after merge
};

// Runs one DownloadTask to completion or a terminal error.
//
// Resume state lives only in the file system: a chunk whose ".done" marker
// exists is skipped. A failed run leaves part files and markers in place.
class DownloadEngine {
public:
    DownloadEngine() = default;
    explicit DownloadEngine(EngineConfig cfg) : config_(cfg) {}

    // Non-copyable, non-movable (atomic members)
    DownloadEngine(const DownloadEngine&) = delete;
    DownloadEngine& operator=(const DownloadEngine&) = delete;

    // Set progress callback (thread-safe)
    void callback(ProgressCallback cb) noexcept {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(cb);
    }

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

    // Blocking; emits Started, Progress..., [Merging], Completed | Error
    [[nodiscard]] std::expected<void, DownloadError> run(DownloadTask task) noexcept;

    [[nodiscard]] DownloadState state() const noexcept { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] std::uint64_t downloaded() const noexcept { return downloaded_.load(std::memory_order_relaxed); }

private:
    [[nodiscard]] std::expected<void, DownloadError> run_whole_file(const DownloadTask& task) noexcept;
    [[nodiscard]] std::expected<void, DownloadError> run_segmented(const DownloadTask& task) noexcept;

    // Fetch `pending` with at most config_.max_concurrent in flight.
    // Waits for every launched fetch, then returns the first error by chunk order.
    [[nodiscard]] std::expected<void, DownloadError>
    fetch_all(const std::string& url, const std::vector<Chunk>& pending) noexcept;

    void add_bytes(std::uint64_t bytes) noexcept;
    void emit(const ProgressEvent& ev) noexcept;
    void emit_progress(bool force) noexcept;
    void deliver(const ProgressCallback& cb, const ProgressEvent& ev) noexcept;

    [[nodiscard]] std::expected<void, DownloadError> fail(DownloadError err) noexcept;

    EngineConfig config_;

    std::atomic<DownloadState> state_{DownloadState::idle};
    std::atomic<std::uint64_t> downloaded_{0};
    std::uint64_t total_{0};

    ProgressCallback callback_;
    std::mutex callback_mutex_;  // Protects callback_ and the throttle state below
    std::chrono::steady_clock::time_point last_emit_{};
    std::uint64_t last_emit_bytes_{0};

    std::mutex delivery_mutex_;  // Serializes observer calls, held without callback_mutex_
};

} // namespace ferry::core
