// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/settings.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <iterator>
#include <limits>
#include <system_error>

namespace ferry::core {

namespace {

DownloadError config_error(std::string detail) {
    return DownloadError{make_error_code(DownloadErrc::invalid_config), std::move(detail)};
}

// Copy `section[key]` into `out` if present; throws nlohmann::json::type_error on mismatch
template<typename T>
void read_key(const nlohmann::json& section, const char* key, T& out) {
    if (section.contains(key)) {
        out = section[key].get<T>();
    }
}

// Unsigned counterpart of read_key; false when the value is negative, fractional or too large for T
template<typename T>
[[nodiscard]] bool read_unsigned(const nlohmann::json& section, const char* key, T& out) {
    if (!section.contains(key)) {
        return true;
    }
    const auto& value = section[key];
    if (!value.is_number_unsigned()) {
        return false;
    }
    auto n = value.get<std::uint64_t>();
    if (n > std::numeric_limits<T>::max()) {
        return false;
    }
    out = static_cast<T>(n);
    return true;
}

} // namespace

std::expected<Settings, DownloadError> Settings::parse(std::string_view json) noexcept {
    Settings settings;
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            return std::unexpected(config_error("top level must be an object"));
        }

        if (j.contains("logging")) {
            read_key(j["logging"], "level", settings.log_level);
        }

        if (j.contains("download")) {
            const auto& d = j["download"];
            if (!read_unsigned(d, "chunk_size", settings.chunk_size)) {
                return std::unexpected(config_error("download.chunk_size must be a non-negative integer"));
            }
            if (!read_unsigned(d, "max_concurrent_chunks", settings.max_concurrent_chunks)) {
                return std::unexpected(config_error("download.max_concurrent_chunks must be a non-negative integer"));
            }
        }

        if (j.contains("cleanup")) {
            const auto& c = j["cleanup"];
            read_key(c, "remove_temp_files", settings.remove_temp_files);
            read_key(c, "remove_on_error", settings.remove_on_error);
        }

        if (j.contains("stream")) {
            const auto& s = j["stream"];
            std::uint32_t stall_sec = static_cast<std::uint32_t>(settings.stall_timeout.count());
            if (!read_unsigned(s, "stall_timeout_sec", stall_sec)) {
                return std::unexpected(config_error("stream.stall_timeout_sec must be a non-negative integer"));
            }
            settings.stall_timeout = std::chrono::seconds(stall_sec);
            read_key(s, "auto_restart", settings.auto_restart);
            if (!read_unsigned(s, "max_restarts", settings.max_restarts)) {
                return std::unexpected(config_error("stream.max_restarts must be a non-negative integer"));
            }
            read_key(s, "program", settings.stream_program);
        }
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(config_error(e.what()));
    }

    if (settings.chunk_size == 0) {
        return std::unexpected(config_error("download.chunk_size must be > 0"));
    }
    if (settings.max_concurrent_chunks == 0) {
        return std::unexpected(config_error("download.max_concurrent_chunks must be > 0"));
    }
    if (settings.stall_timeout.count() == 0) {
        return std::unexpected(config_error("stream.stall_timeout_sec must be > 0"));
    }
    if (settings.stream_program.empty()) {
        return std::unexpected(config_error("stream.program must not be empty"));
    }
    return settings;
}

std::expected<Settings, DownloadError> Settings::load(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            return std::unexpected(DownloadError{ec, path.string()});
        }
        spdlog::debug("No configuration at {}, using defaults", path.string());
        return Settings{};
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(DownloadError{make_error_code(std::errc::permission_denied), path.string()});
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto settings = parse(text);
    if (!settings) {
        auto err = settings.error();
        err.detail = path.string() + ": " + err.detail;
        return std::unexpected(std::move(err));
    }
    return settings;
}

} // namespace ferry::core
