// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <ferry/core/error.hpp>
#include <ferry/stream/progress_parser.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace ferry::stream {

struct DownloadOptions {
    std::chrono::seconds stall_timeout{core::DEFAULT_STALL_TIMEOUT};  // No progress line for this long = hang
    bool auto_restart{core::DEFAULT_AUTO_RESTART};
    std::uint32_t max_restarts{core::DEFAULT_MAX_RESTARTS};          // Total attempts when auto_restart is on
    std::chrono::milliseconds backoff_unit{1000};                    // Delay before retry N: 2^N units
};

// Builds argv for one attempt writing to `temp`
using CommandBuilder = std::function<std::vector<std::string>(const std::string& url,
                                                              const std::filesystem::path& temp)>;

using SampleCallback = std::function<void(const StreamProgressSample&)>;

// -y -nostdin -i <url> -c copy -progress pipe:1 -nostats <temp>
[[nodiscard]] std::vector<std::string> ffmpeg_command(const std::string& program,
                                                      const std::string& url,
                                                      const std::filesystem::path& temp);

// Supervises an external stream-copy program.
//
// Each attempt writes to temp_path(output). The program's stdout carries
// key=value progress lines; if none arrives within stall_timeout the program
// is killed. Failed attempts are retried from scratch with exponential
// backoff while auto_restart is set and attempts < max_restarts. Only a
// successful attempt is renamed to `output`.
class StreamSupervisor {
public:
    explicit StreamSupervisor(DownloadOptions options = {}, std::string program = std::string(core::DEFAULT_STREAM_PROGRAM));

    void command_builder(CommandBuilder builder) { builder_ = std::move(builder); }

    // Invoked on the calling thread of run()
    void callback(SampleCallback cb) { callback_ = std::move(cb); }

    [[nodiscard]] const DownloadOptions& options() const noexcept { return options_; }

    [[nodiscard]] std::expected<void, core::DownloadError>
    run(const std::string& url, const std::filesystem::path& output) noexcept;

    // Attempts made by the last run()
    [[nodiscard]] std::uint32_t attempts() const noexcept { return attempts_; }

    // <stem>.part<ext> beside `output`
    [[nodiscard]] static std::filesystem::path temp_path(const std::filesystem::path& output);

private:
    [[nodiscard]] std::expected<void, core::DownloadError>
    run_attempt(const std::string& url, const std::filesystem::path& temp);

    void deliver(const StreamProgressSample& sample) noexcept;

    DownloadOptions options_;
    CommandBuilder builder_;
    SampleCallback callback_;
    std::uint32_t attempts_{0};
};

} // namespace ferry::stream
