// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <ferry/core/download_engine.hpp>
#include <ferry/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace ferry::core {

// Runtime settings from the JSON configuration file
//
//   {
//     "logging":  { "level": "debug" },
//     "download": { "chunk_size": 8388608, "max_concurrent_chunks": 4 },
//     "cleanup":  { "remove_temp_files": true, "remove_on_error": false },
//     "stream":   { "stall_timeout_sec": 20, "auto_restart": true,
//                   "max_restarts": 3, "program": "ffmpeg" }
//   }
//
// Every key is optional; absent keys keep their compile-time default.
struct Settings {
    std::string log_level;                                  // Empty = not configured
    std::uint64_t chunk_size{DEFAULT_CHUNK_SIZE};
    std::uint32_t max_concurrent_chunks{MAX_CONCURRENT_CHUNKS};
    bool remove_temp_files{true};
    bool remove_on_error{false};
    std::chrono::seconds stall_timeout{DEFAULT_STALL_TIMEOUT};
    bool auto_restart{DEFAULT_AUTO_RESTART};
    std::uint32_t max_restarts{DEFAULT_MAX_RESTARTS};
    std::string stream_program{DEFAULT_STREAM_PROGRAM};

    // Load `path`; a missing file yields defaults, a malformed one an error
    [[nodiscard]] static std::expected<Settings, DownloadError>
    load(const std::filesystem::path& path) noexcept;

    [[nodiscard]] static std::expected<Settings, DownloadError>
    parse(std::string_view json) noexcept;

    [[nodiscard]] EngineConfig engine_config() const noexcept {
        return EngineConfig{chunk_size, max_concurrent_chunks, remove_temp_files};
    }
};

} // namespace ferry::core
