// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/stream/stream_supervisor.hpp>
#include <ferry/stream/child_process.hpp>
#include <ferry/disk/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/streambuf.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>
#include <functional>
#include <istream>
#include <thread>

namespace ferry::stream {

namespace asio = boost::asio;

std::vector<std::string> ffmpeg_command(const std::string& program,
                                        const std::string& url,
                                        const std::filesystem::path& temp) {
    return {program, "-y", "-nostdin", "-i", url, "-c", "copy",
            "-progress", "pipe:1", "-nostats", temp.string()};
}

//=============================================================================
// StreamSupervisor
//=============================================================================

StreamSupervisor::StreamSupervisor(DownloadOptions options, std::string program)
    : options_(options)
    , builder_([program = std::move(program)](const std::string& url, const std::filesystem::path& temp) {
          return ffmpeg_command(program, url, temp);
      }) {}

std::filesystem::path StreamSupervisor::temp_path(const std::filesystem::path& output) {
    auto name = output.stem().string() + std::string(core::PART_SUFFIX) + output.extension().string();
    return output.parent_path() / name;
}

std::expected<void, core::DownloadError>
StreamSupervisor::run(const std::string& url, const std::filesystem::path& output) noexcept {
    attempts_ = 0;

    std::filesystem::path temp;
    try {
        temp = temp_path(output);
    } catch (const std::exception& e) {
        return std::unexpected(core::DownloadError{make_error_code(disk::DiskErrc::invalid_path), e.what()});
    }

    while (true) {
        ++attempts_;
        spdlog::info("Stream attempt {} for {}", attempts_, output.string());

        std::expected<void, core::DownloadError> result;
        try {
            result = run_attempt(url, temp);
        } catch (const std::exception& e) {
            result = std::unexpected(core::DownloadError{make_error_code(core::DownloadErrc::network_error), e.what()});
        }

        if (result) {
            std::error_code ec;
            std::filesystem::rename(temp, output, ec);
            if (ec) {
                spdlog::error("Cannot rename {} to {}: {}", temp.string(), output.string(), ec.message());
                return std::unexpected(core::DownloadError{make_error_code(disk::DiskErrc::rename_error), ec.message()});
            }
            spdlog::info("Saved {}", output.string());
            return {};
        }

        if (!options_.auto_restart || attempts_ >= options_.max_restarts) {
            spdlog::error("Stream failed after {} attempt(s): {}", attempts_, result.error().message());
            return std::unexpected(result.error());
        }

        auto backoff = options_.backoff_unit * (std::int64_t{1} << std::min<std::uint32_t>(attempts_, 30));
        spdlog::warn("Attempt {} failed ({}), restarting in {} ms",
                     attempts_, result.error().message(), backoff.count());
        std::this_thread::sleep_for(backoff);
    }
}

std::expected<void, core::DownloadError>
StreamSupervisor::run_attempt(const std::string& url, const std::filesystem::path& temp) {
    auto child = ChildProcess::spawn(builder_(url, temp));
    if (!child) {
        return std::unexpected(child.error());
    }

    asio::io_context io;
    asio::posix::stream_descriptor out(io, child->release_stdout());
    asio::posix::stream_descriptor err(io, child->release_stderr());
    asio::steady_timer timer(io);
    asio::streambuf out_buf;
    asio::streambuf err_buf;

    ProgressParser parser;
    bool stalled = false;
    bool finished = false;

    const auto take_line = [](asio::streambuf& buf) {
        std::istream is(&buf);
        std::string line;
        std::getline(is, line);
        return line;
    };

    // Stall watchdog: a wait that ends before the current deadline was re-armed
    std::function<void()> watch = [&] {
        timer.async_wait([&](const boost::system::error_code&) {
            if (finished) return;
            if (timer.expiry() <= asio::steady_timer::clock_type::now()) {
                stalled = true;
                finished = true;
                spdlog::warn("No progress for {} s, killing pid {}",
                             options_.stall_timeout.count(), child->pid());
                child->kill();
                boost::system::error_code ignored;
                out.close(ignored);
                err.close(ignored);
                return;
            }
            watch();
        });
    };

    std::function<void()> read_progress = [&] {
        timer.expires_after(options_.stall_timeout);
        asio::async_read_until(out, out_buf, '\n',
            [&](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    // Trailing line without a newline
                    if (ec == asio::error::eof && out_buf.size() > 0) {
                        if (auto sample = parser.feed(take_line(out_buf))) deliver(*sample);
                    }
                    if (!stalled) {
                        finished = true;
                        timer.cancel();
                    }
                    return;
                }
                if (auto sample = parser.feed(take_line(out_buf))) {
                    deliver(*sample);
                }
                read_progress();
            });
    };

    std::function<void()> drain_stderr = [&] {
        asio::async_read_until(err, err_buf, '\n',
            [&](const boost::system::error_code& ec, std::size_t) {
                if (ec) return;
                auto line = take_line(err_buf);
                if (!line.empty()) spdlog::debug("[{}] {}", child->pid(), line);
                drain_stderr();
            });
    };

    read_progress();
    watch();
    drain_stderr();
    io.run();

    auto status = child->wait();
    if (stalled) {
        return std::unexpected(core::DownloadError{make_error_code(core::DownloadErrc::stall_detected),
                                                   "no progress for " + std::to_string(options_.stall_timeout.count()) + " s"});
    }
    if (!status) {
        return std::unexpected(core::DownloadError{status.error()});
    }
    if (*status != 0) {
        return std::unexpected(core::DownloadError::exited(*status));
    }

    if (!parser.empty()) {
        deliver(parser.current());
    }
    return {};
}

void StreamSupervisor::deliver(const StreamProgressSample& sample) noexcept {
    if (!callback_) {
        return;
    }
    try {
        callback_(sample);
    } catch (const std::exception& e) {
        spdlog::warn("Stream progress callback threw: {}", e.what());
    } catch (...) {
        spdlog::warn("Stream progress callback threw a non-standard exception");
    }
}

} // namespace ferry::stream
