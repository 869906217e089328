// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/stream/stream_supervisor.hpp>
#include "support/scratch_dir.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <stdexcept>

using namespace ferry::stream;
using ferry::core::DownloadErrc;
using ferry::test::ScratchDir;
using ferry::test::read_file;

namespace fs = std::filesystem;

namespace {

// Run `script` under /bin/sh with the temporary output path as $1
CommandBuilder shell(std::string script) {
    return [script = std::move(script)](const std::string&, const fs::path& temp) {
        return std::vector<std::string>{"/bin/sh", "-c", script, "sh", temp.string()};
    };
}

DownloadOptions fast_options() {
    DownloadOptions opts;
    opts.stall_timeout = std::chrono::seconds(5);
    opts.auto_restart = false;
    opts.max_restarts = 3;
    opts.backoff_unit = std::chrono::milliseconds(1);
    return opts;
}

std::size_t line_count(const fs::path& path) {
    auto text = read_file(path);
    return static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));
}

} // namespace

TEST_CASE("StreamSupervisor paths and command", "[stream]") {
    SECTION("Temporary path keeps the extension") {
        CHECK(StreamSupervisor::temp_path("/rec/video.mp4") == "/rec/video.part.mp4");
        CHECK(StreamSupervisor::temp_path("capture") == "capture.part");
    }

    SECTION("ffmpeg arguments") {
        auto argv = ffmpeg_command("ffmpeg", "http://h/live.m3u8", "/rec/video.part.mp4");
        std::vector<std::string> expected{"ffmpeg", "-y", "-nostdin", "-i", "http://h/live.m3u8",
                                          "-c", "copy", "-progress", "pipe:1", "-nostats",
                                          "/rec/video.part.mp4"};
        CHECK(argv == expected);
    }

    SECTION("Defaults") {
        DownloadOptions opts;
        CHECK(opts.stall_timeout == std::chrono::seconds(20));
        CHECK(opts.auto_restart);
        CHECK(opts.max_restarts == 3);
    }
}

TEST_CASE("StreamSupervisor success", "[stream]") {
    ScratchDir dir;
    auto output = dir / "video.mp4";

    StreamSupervisor supervisor(fast_options());
    std::vector<StreamProgressSample> samples;
    supervisor.callback([&samples](const StreamProgressSample& s) { samples.push_back(s); });

    SECTION("Output renamed and progress delivered") {
        supervisor.command_builder(shell(
            "printf 'frame=1\\nout_time_ms=1000\\nprogress=continue\\n\\n';"
            "echo data > \"$1\";"
            "printf 'frame=2\\nout_time_ms=2000\\nprogress=end\\n'"));

        REQUIRE(supervisor.run("http://h/live", output));
        CHECK(supervisor.attempts() == 1);
        CHECK(read_file(output) == "data\n");
        CHECK_FALSE(fs::exists(StreamSupervisor::temp_path(output)));

        REQUIRE(samples.size() >= 3);
        CHECK(samples.front().at("out_time_ms") == "1000");
        CHECK(samples.back().at("out_time_ms") == "2000");
        CHECK(samples.back().at("progress") == "end");
        CHECK(samples.back().at("frame") == "2");
    }

    SECTION("Heavy stderr does not block") {
        supervisor.command_builder(shell(
            "i=0; while [ $i -lt 3000 ]; do echo \"noise line $i\" >&2; i=$((i+1)); done;"
            "echo ok > \"$1\""));
        REQUIRE(supervisor.run("http://h/live", output));
        CHECK(read_file(output) == "ok\n");
    }

    SECTION("stdin is at end of file") {
        supervisor.command_builder(shell("cat; echo done > \"$1\""));
        REQUIRE(supervisor.run("http://h/live", output));
        CHECK(read_file(output) == "done\n");
    }

    SECTION("Last line without newline is parsed") {
        supervisor.command_builder(shell("printf 'progress=end'; : > \"$1\""));
        REQUIRE(supervisor.run("http://h/live", output));
        REQUIRE_FALSE(samples.empty());
        CHECK(samples.back().at("progress") == "end");
    }

    SECTION("Throwing observer does not fail the attempt") {
        int calls = 0;
        supervisor.callback([&calls](const StreamProgressSample&) {
            ++calls;
            throw std::runtime_error("observer failure");
        });
        supervisor.command_builder(shell(
            "printf 'out_time_ms=1000\\nprogress=continue\\n';"
            "echo data > \"$1\";"
            "printf 'out_time_ms=2000\\nprogress=end\\n'"));

        REQUIRE(supervisor.run("http://h/live", output));
        CHECK(supervisor.attempts() == 1);
        CHECK(read_file(output) == "data\n");
        CHECK(calls >= 4);
    }
}

TEST_CASE("StreamSupervisor failures", "[stream]") {
    ScratchDir dir;
    auto output = dir / "video.mp4";

    SECTION("Non-zero exit") {
        StreamSupervisor supervisor(fast_options());
        supervisor.command_builder(shell("echo partial > \"$1\"; exit 3"));
        auto result = supervisor.run("http://h/live", output);
        REQUIRE_FALSE(result);
        CHECK(result.error().code == DownloadErrc::process_exit);
        REQUIRE(result.error().exit_code);
        CHECK(*result.error().exit_code == 3);
        CHECK(supervisor.attempts() == 1);
        CHECK_FALSE(fs::exists(output));
    }

    SECTION("Stall kills the process") {
        auto opts = fast_options();
        opts.stall_timeout = std::chrono::seconds(1);
        StreamSupervisor supervisor(opts);
        supervisor.command_builder(shell("echo frame=1; exec sleep 10"));

        auto start = std::chrono::steady_clock::now();
        auto result = supervisor.run("http://h/live", output);
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE_FALSE(result);
        CHECK(result.error().code == DownloadErrc::stall_detected);
        CHECK(elapsed < std::chrono::seconds(5));
        CHECK(supervisor.attempts() == 1);
        CHECK_FALSE(fs::exists(output));
    }

    SECTION("Missing program") {
        StreamSupervisor supervisor(fast_options(), "/nonexistent/ferry-missing-program");
        auto result = supervisor.run("http://h/live", output);
        REQUIRE_FALSE(result);
        CHECK(result.error().code == DownloadErrc::spawn_failed);
    }
}

TEST_CASE("StreamSupervisor restarts", "[stream]") {
    ScratchDir dir;
    auto output = dir / "video.mp4";
    auto counter = dir / "attempts.log";

    auto opts = fast_options();
    opts.auto_restart = true;

    SECTION("Gives up after max_restarts attempts") {
        StreamSupervisor supervisor(opts);
        supervisor.command_builder(shell("echo x >> '" + counter.string() + "'; exit 1"));

        auto result = supervisor.run("http://h/live", output);
        REQUIRE_FALSE(result);
        CHECK(result.error().code == DownloadErrc::process_exit);
        CHECK(supervisor.attempts() == 3);
        CHECK(line_count(counter) == 3);
        CHECK_FALSE(fs::exists(output));
    }

    SECTION("Stalls are retried too") {
        opts.stall_timeout = std::chrono::seconds(1);
        opts.max_restarts = 2;
        StreamSupervisor supervisor(opts);
        supervisor.command_builder(shell("echo x >> '" + counter.string() + "'; exec sleep 10"));

        auto result = supervisor.run("http://h/live", output);
        REQUIRE_FALSE(result);
        CHECK(result.error().code == DownloadErrc::stall_detected);
        CHECK(supervisor.attempts() == 2);
        CHECK(line_count(counter) == 2);
    }

    SECTION("Succeeds on a later attempt") {
        StreamSupervisor supervisor(opts);
        supervisor.command_builder(shell(
            "if [ -f '" + counter.string() + "' ]; then echo ok > \"$1\"; exit 0; fi;"
            "echo x > '" + counter.string() + "'; exit 2"));

        REQUIRE(supervisor.run("http://h/live", output));
        CHECK(supervisor.attempts() == 2);
        CHECK(read_file(output) == "ok\n");
    }

    SECTION("Disabled restart fails once") {
        opts.auto_restart = false;
        StreamSupervisor supervisor(opts);
        supervisor.command_builder(shell("echo x >> '" + counter.string() + "'; exit 1"));

        REQUIRE_FALSE(supervisor.run("http://h/live", output));
        CHECK(supervisor.attempts() == 1);
        CHECK(line_count(counter) == 1);
    }
}
