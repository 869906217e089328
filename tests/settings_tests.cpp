// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/core/logging.hpp>
#include <ferry/core/settings.hpp>
#include "support/scratch_dir.hpp"

using namespace ferry::core;
using ferry::test::ScratchDir;
using ferry::test::write_file;

TEST_CASE("Settings defaults", "[settings]") {
    Settings s;
    CHECK(s.log_level.empty());
    CHECK(s.chunk_size == DEFAULT_CHUNK_SIZE);
    CHECK(s.max_concurrent_chunks == MAX_CONCURRENT_CHUNKS);
    CHECK(s.remove_temp_files);
    CHECK_FALSE(s.remove_on_error);
    CHECK(s.stall_timeout == DEFAULT_STALL_TIMEOUT);
    CHECK(s.auto_restart);
    CHECK(s.max_restarts == 3);
    CHECK(s.stream_program == "ffmpeg");

    auto cfg = s.engine_config();
    CHECK(cfg.chunk_size == DEFAULT_CHUNK_SIZE);
    CHECK(cfg.max_concurrent == MAX_CONCURRENT_CHUNKS);
    CHECK(cfg.remove_temp_files);
}

TEST_CASE("Settings::parse", "[settings]") {
    SECTION("Every key") {
        auto s = Settings::parse(R"({
            "logging":  { "level": "debug" },
            "download": { "chunk_size": 1048576, "max_concurrent_chunks": 8 },
            "cleanup":  { "remove_temp_files": false, "remove_on_error": true },
            "stream":   { "stall_timeout_sec": 45, "auto_restart": false,
                          "max_restarts": 5, "program": "/opt/ffmpeg/bin/ffmpeg" }
        })");
        REQUIRE(s);
        CHECK(s->log_level == "debug");
        CHECK(s->chunk_size == 1048576);
        CHECK(s->max_concurrent_chunks == 8);
        CHECK_FALSE(s->remove_temp_files);
        CHECK(s->remove_on_error);
        CHECK(s->stall_timeout == std::chrono::seconds(45));
        CHECK_FALSE(s->auto_restart);
        CHECK(s->max_restarts == 5);
        CHECK(s->stream_program == "/opt/ffmpeg/bin/ffmpeg");
    }

    SECTION("Partial file keeps defaults") {
        auto s = Settings::parse(R"({ "download": { "max_concurrent_chunks": 2 } })");
        REQUIRE(s);
        CHECK(s->max_concurrent_chunks == 2);
        CHECK(s->chunk_size == DEFAULT_CHUNK_SIZE);
        CHECK(s->remove_temp_files);
    }

    SECTION("Empty object") {
        REQUIRE(Settings::parse("{}"));
    }

    SECTION("Malformed JSON") {
        auto s = Settings::parse("{ \"download\": ");
        REQUIRE_FALSE(s);
        CHECK(s.error().code == DownloadErrc::invalid_config);
    }

    SECTION("Wrong type") {
        auto s = Settings::parse(R"({ "download": { "chunk_size": "big" } })");
        REQUIRE_FALSE(s);
        CHECK(s.error().code == DownloadErrc::invalid_config);
    }

    SECTION("Zero chunk size") {
        auto s = Settings::parse(R"({ "download": { "chunk_size": 0 } })");
        REQUIRE_FALSE(s);
        CHECK(s.error().detail.find("chunk_size") != std::string::npos);
    }

    SECTION("Negative and oversized integers") {
        auto stall = Settings::parse(R"({ "stream": { "stall_timeout_sec": -1 } })");
        REQUIRE_FALSE(stall);
        CHECK(stall.error().code == DownloadErrc::invalid_config);
        CHECK(stall.error().detail.find("stall_timeout_sec") != std::string::npos);

        auto chunk = Settings::parse(R"({ "download": { "chunk_size": -4096 } })");
        REQUIRE_FALSE(chunk);
        CHECK(chunk.error().detail.find("chunk_size") != std::string::npos);

        auto jobs = Settings::parse(R"({ "download": { "max_concurrent_chunks": 4294967296 } })");
        REQUIRE_FALSE(jobs);
        CHECK(jobs.error().code == DownloadErrc::invalid_config);

        REQUIRE_FALSE(Settings::parse(R"({ "stream": { "max_restarts": 2.5 } })"));
    }

    SECTION("Zero concurrency") {
        REQUIRE_FALSE(Settings::parse(R"({ "download": { "max_concurrent_chunks": 0 } })"));
    }

    SECTION("Top level must be an object") {
        REQUIRE_FALSE(Settings::parse("[1, 2]"));
    }
}

TEST_CASE("Settings::load", "[settings]") {
    ScratchDir dir;

    SECTION("Missing file gives defaults") {
        auto s = Settings::load(dir / "ferry.json");
        REQUIRE(s);
        CHECK(s->chunk_size == DEFAULT_CHUNK_SIZE);
    }

    SECTION("Reads the file") {
        write_file(dir / "ferry.json", R"({ "stream": { "max_restarts": 7 } })");
        auto s = Settings::load(dir / "ferry.json");
        REQUIRE(s);
        CHECK(s->max_restarts == 7);
    }

    SECTION("Malformed file names the path") {
        write_file(dir / "ferry.json", "not json");
        auto s = Settings::load(dir / "ferry.json");
        REQUIRE_FALSE(s);
        CHECK(s.error().code == DownloadErrc::invalid_config);
        CHECK(s.error().detail.find("ferry.json") != std::string::npos);
    }
}

TEST_CASE("resolve_log_level", "[logging]") {
    CHECK(resolve_log_level("debug", nullptr) == spdlog::level::debug);
    CHECK(resolve_log_level("", "warn") == spdlog::level::warn);
    CHECK(resolve_log_level("error", "trace") == spdlog::level::err);
    CHECK(resolve_log_level("", nullptr) == spdlog::level::info);
    CHECK(resolve_log_level("loud", nullptr) == spdlog::level::info);
    CHECK(resolve_log_level("loud", "trace") == spdlog::level::trace);
    CHECK(resolve_log_level("off", nullptr) == spdlog::level::off);
}
