// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace ferry::core {

enum class DownloadErrc {
    success = 0,
    network_error,
    timeout,
    not_found,
    permission_denied,
    server_error,
    http_error,
    invalid_url,
    invalid_range,
    missing_content_length,
    short_body,
    merge_failed,
    spawn_failed,
    process_exit,
    stall_detected,
    too_many_redirects,
    ssl_error,
    dns_error,
    connection_lost,
    invalid_config,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "ferry::download";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:                return "Success";
            case DownloadErrc::network_error:          return "Network error";
            case DownloadErrc::timeout:                return "Operation timed out";
            case DownloadErrc::not_found:              return "Resource not found (404)";
            case DownloadErrc::permission_denied:      return "Permission denied (401/403)";
            case DownloadErrc::server_error:           return "Server error (5xx)";
            case DownloadErrc::http_error:             return "Unexpected HTTP status";
            case DownloadErrc::invalid_url:            return "Invalid URL";
            case DownloadErrc::invalid_range:          return "Invalid byte range";
            case DownloadErrc::missing_content_length: return "Content-Length missing";
            case DownloadErrc::short_body:             return "Response body shorter than requested range";
            case DownloadErrc::merge_failed:           return "Merging chunk files failed";
            case DownloadErrc::spawn_failed:           return "Could not start external process";
            case DownloadErrc::process_exit:           return "External process exited with non-zero status";
            case DownloadErrc::stall_detected:         return "Download stalled";
            case DownloadErrc::too_many_redirects:     return "Too many redirects";
            case DownloadErrc::ssl_error:              return "SSL/TLS error";
            case DownloadErrc::dns_error:              return "DNS resolution failed";
            case DownloadErrc::connection_lost:        return "Connection lost";
            case DownloadErrc::invalid_config:         return "Invalid configuration";
            default:                                   return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

// Error with the context needed for a targeted resume or diagnosis
struct DownloadError {
    std::error_code code;
    std::optional<std::uint32_t> chunk_index;   // Set for chunk-scoped failures
    std::optional<int> exit_code;               // Set for process_exit
    std::string detail;                         // e.g. "HTTP 503", a file path

    DownloadError() = default;
    DownloadError(std::error_code ec, std::string info = {})
        : code(ec), detail(std::move(info)) {}

    [[nodiscard]] static DownloadError chunk(std::uint32_t index, DownloadError inner);
    [[nodiscard]] static DownloadError exited(int status);

    [[nodiscard]] bool is_chunk_failure() const noexcept { return chunk_index.has_value(); }

    [[nodiscard]] std::string message() const;
};

} // namespace ferry::core

namespace std {

template<>
struct is_error_code_enum<ferry::core::DownloadErrc> : true_type {};

} // namespace std
