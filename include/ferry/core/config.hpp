// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <cstddef>
#include <chrono>
#include <string_view>

namespace ferry::core {

constexpr std::uint64_t DEFAULT_CHUNK_SIZE = 8 * 1024 * 1024;       // 8 MiB
constexpr std::uint32_t MAX_CONCURRENT_CHUNKS = 4;                 // In-flight range GETs

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t LOW_SPEED_TIME_SEC = 60;                    // curl aborts below 1 B/s for this long

constexpr std::chrono::milliseconds PROGRESS_INTERVAL{250};

constexpr std::size_t MERGE_BUFFER_SIZE = 1024 * 1024;             // 1 MiB
constexpr std::size_t CURL_BUFFER_SIZE = 256 * 1024;               // 256 KB

constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

// On-disk resume protocol: <stem>.part<index> and <stem>.part<index>.done
constexpr std::string_view PART_SUFFIX = ".part";
constexpr std::string_view DONE_SUFFIX = ".done";

// Stream supervisor defaults
constexpr std::chrono::seconds DEFAULT_STALL_TIMEOUT{20};
constexpr bool DEFAULT_AUTO_RESTART = true;
constexpr std::uint32_t DEFAULT_MAX_RESTARTS = 3;
constexpr std::string_view DEFAULT_STREAM_PROGRAM = "ffmpeg";

constexpr std::string_view DEFAULT_CONFIG_FILE = "ferry.json";
constexpr std::string_view LOG_LEVEL_ENV = "FERRY_LOG";

} // namespace ferry::core
