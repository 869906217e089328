// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace ferry::core {

// HTTP response metadata (body bytes go to the caller's sink)
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;   // Lower-cased names, final response only
    std::optional<std::uint64_t> content_length;  // Absent when the server sent none
    bool accepts_ranges{false};                   // "Accept-Ranges: bytes"
    std::string content_type;
    std::string filename;                         // From Content-Disposition
    std::uint64_t body_bytes{0};
};

// Inclusive byte range sent as "Range: bytes=<first>-<last>"
struct ByteRange {
    std::uint64_t first{0};
    std::uint64_t last{0};
};

// Receives body data as it arrives; a non-empty error aborts the transfer
using BodySink = std::function<std::error_code(const char* data, std::size_t size)>;

// Blocking libcurl client. One session per thread; the easy handle and its
// connection cache are reused across requests made through the same session.
class HttpSession {
public:
    HttpSession();
    ~HttpSession();

    // Non-copyable, movable
    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;
    HttpSession(HttpSession&& other) noexcept;
    HttpSession& operator=(HttpSession&& other) noexcept;

    // HEAD request: size and range capability
    [[nodiscard]] std::expected<HttpResponse, DownloadError>
    head(const std::string& url) noexcept;

    // GET request streamed into `sink`, optionally restricted to `range`.
    // Any non-2xx final status is an error and no body reaches the sink.
    [[nodiscard]] std::expected<HttpResponse, DownloadError>
    get(const std::string& url,
        const BodySink& sink,
        std::optional<ByteRange> range = std::nullopt) noexcept;

    // Process-wide libcurl setup; safe to call repeatedly and from any thread
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

    // Map an HTTP status (>= 400 or otherwise unexpected) to an error
    [[nodiscard]] static DownloadError status_error(long http_code);

    [[nodiscard]] static std::string parse_content_disposition(std::string_view content_disposition);

private:
    void* handle_{nullptr};  // CURL*
};

} // namespace ferry::core
