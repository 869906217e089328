// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/stream/child_process.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

extern char** environ;

namespace ferry::stream {

namespace {

// posix_spawn_file_actions_t with guaranteed destroy
struct FileActions {
    posix_spawn_file_actions_t actions;
    bool ok{false};

    FileActions() { ok = posix_spawn_file_actions_init(&actions) == 0; }
    ~FileActions() { if (ok) posix_spawn_file_actions_destroy(&actions); }

    FileActions(const FileActions&) = delete;
    FileActions& operator=(const FileActions&) = delete;
};

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

core::DownloadError spawn_error(int err, const std::string& program) {
    return core::DownloadError{make_error_code(core::DownloadErrc::spawn_failed),
                               program + ": " + std::strerror(err)};
}

} // namespace

ChildProcess::~ChildProcess() {
    close_pipes();
    if (pid_ > 0) {
        kill();
        (void)wait();
    }
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(std::exchange(other.pid_, -1))
    , out_fd_(std::exchange(other.out_fd_, -1))
    , err_fd_(std::exchange(other.err_fd_, -1)) {}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        close_pipes();
        if (pid_ > 0) {
            kill();
            (void)wait();
        }
        pid_ = std::exchange(other.pid_, -1);
        out_fd_ = std::exchange(other.out_fd_, -1);
        err_fd_ = std::exchange(other.err_fd_, -1);
    }
    return *this;
}

std::expected<ChildProcess, core::DownloadError>
ChildProcess::spawn(const std::vector<std::string>& argv) noexcept {
    if (argv.empty()) {
        return std::unexpected(core::DownloadError{make_error_code(core::DownloadErrc::spawn_failed), "empty command"});
    }
    const std::string& program = argv.front();

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        return std::unexpected(spawn_error(errno, program));
    }
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return std::unexpected(spawn_error(err, program));
    }

    FileActions fa;
    int rc = fa.ok ? 0 : ENOMEM;
    if (rc == 0) rc = posix_spawn_file_actions_addopen(&fa.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    if (rc == 0) rc = posix_spawn_file_actions_adddup2(&fa.actions, out_pipe[1], STDOUT_FILENO);
    if (rc == 0) rc = posix_spawn_file_actions_adddup2(&fa.actions, err_pipe[1], STDERR_FILENO);

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = -1;
    if (rc == 0) {
        rc = posix_spawnp(&pid, program.c_str(), &fa.actions, nullptr, args.data(), environ);
    }

    // Parent keeps only the read ends
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    if (rc != 0) {
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        return std::unexpected(spawn_error(rc, program));
    }

    spdlog::debug("Started {} (pid {})", program, pid);

    ChildProcess child;
    child.pid_ = pid;
    child.out_fd_ = out_pipe[0];
    child.err_fd_ = err_pipe[0];
    return child;
}

int ChildProcess::release_stdout() noexcept {
    return std::exchange(out_fd_, -1);
}

int ChildProcess::release_stderr() noexcept {
    return std::exchange(err_fd_, -1);
}

void ChildProcess::kill() noexcept {
    if (pid_ > 0) {
        ::kill(pid_, SIGKILL);
    }
}

std::expected<int, std::error_code> ChildProcess::wait() noexcept {
    if (pid_ <= 0) {
        return std::unexpected(std::make_error_code(std::errc::no_child_process));
    }

    int status = 0;
    pid_t rc;
    do {
        rc = ::waitpid(pid_, &status, 0);
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) {
        auto ec = std::error_code(errno, std::generic_category());
        pid_ = -1;
        return std::unexpected(ec);
    }
    pid_ = -1;

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

void ChildProcess::close_pipes() noexcept {
    close_fd(out_fd_);
    close_fd(err_fd_);
}

} // namespace ferry::stream
