// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/error.hpp>
#include <sys/types.h>
#include <expected>
#include <string>
#include <vector>

namespace ferry::stream {

// A spawned program with stdout and stderr on pipes and stdin on /dev/null.
// Destroying a still-running child kills and reaps it.
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    // Non-copyable, movable
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;

    // argv[0] is looked up in PATH
    [[nodiscard]] static std::expected<ChildProcess, core::DownloadError>
    spawn(const std::vector<std::string>& argv) noexcept;

    // Hand the read end of a pipe to the caller (it must close it)
    [[nodiscard]] int release_stdout() noexcept;
    [[nodiscard]] int release_stderr() noexcept;

    // SIGKILL; no-op once reaped
    void kill() noexcept;

    // Block until exit. Returns the exit status, or -1 if killed by a signal.
    [[nodiscard]] std::expected<int, std::error_code> wait() noexcept;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }
    [[nodiscard]] bool running() const noexcept { return pid_ > 0; }

private:
    void close_pipes() noexcept;

    pid_t pid_{-1};
    int out_fd_{-1};
    int err_fd_{-1};
};

} // namespace ferry::stream
