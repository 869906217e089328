// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/http_session.hpp>
#include <ferry/core/config.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <string>
#include <utility>

namespace ferry::core {

namespace {

std::once_flag g_curl_init;

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) {
        s.remove_suffix(1);
    }
    return s;
}

// Header callback; a status line starts a new header block (redirects)
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);
    if (header.starts_with("HTTP/")) {
        headers->clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    (*headers)[to_lower(trim(header.substr(0, colon)))] = std::string(trim(header.substr(colon + 1)));
    return total;
}

struct SinkContext {
    const BodySink* sink{nullptr};
    std::error_code sink_error;
    std::uint64_t received{0};
};

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* ctx = static_cast<SinkContext*>(userdata);
    std::size_t total = size * nitems;
    if (!ctx || !ctx->sink || !*ctx->sink) return total;

    try {
        ctx->sink_error = (*ctx->sink)(ptr, total);
    } catch (const std::exception& e) {
        spdlog::error("http: body sink threw: {}", e.what());
        ctx->sink_error = make_error_code(DownloadErrc::network_error);
    }
    if (ctx->sink_error) return 0;  // CURLE_WRITE_ERROR

    ctx->received += total;
    return total;
}

DownloadError curl_error(CURLcode result, const char* errbuf) {
    std::string detail = (errbuf && errbuf[0] != '\0') ? errbuf : curl_easy_strerror(result);
    switch (result) {
        case CURLE_OPERATION_TIMEDOUT:
            return {make_error_code(DownloadErrc::timeout), std::move(detail)};
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return {make_error_code(DownloadErrc::dns_error), std::move(detail)};
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return {make_error_code(DownloadErrc::ssl_error), std::move(detail)};
        case CURLE_TOO_MANY_REDIRECTS:
            return {make_error_code(DownloadErrc::too_many_redirects), std::move(detail)};
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return {make_error_code(DownloadErrc::invalid_url), std::move(detail)};
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
            return {make_error_code(DownloadErrc::connection_lost), std::move(detail)};
        default:
            return {make_error_code(DownloadErrc::network_error), std::move(detail)};
    }
}

void apply_common_options(CURL* curl, const std::string& url, char* errbuf,
                          std::map<std::string, std::string>* headers) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, FOLLOW_REDIRECTS ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(CONNECTION_TIMEOUT_SEC));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(LOW_SPEED_TIME_SEC));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, headers);
}

// Fill the derived fields of `response` from its header map
void finish_response(CURL* curl, HttpResponse& response) {
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);

    auto cl_it = response.headers.find("content-length");
    if (cl_it != response.headers.end() && !cl_it->second.empty()) {
        char* end = nullptr;
        unsigned long long val = std::strtoull(cl_it->second.c_str(), &end, 10);
        if (end == cl_it->second.c_str() + cl_it->second.size()) {
            response.content_length = static_cast<std::uint64_t>(val);
        }
    }

    auto ct_it = response.headers.find("content-type");
    if (ct_it != response.headers.end()) {
        response.content_type = ct_it->second;
    }

    auto ar_it = response.headers.find("accept-ranges");
    response.accepts_ranges = ar_it != response.headers.end() &&
                              to_lower(ar_it->second).find("bytes") != std::string::npos;

    auto cd_it = response.headers.find("content-disposition");
    if (cd_it != response.headers.end()) {
        response.filename = HttpSession::parse_content_disposition(cd_it->second);
    }
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession() {
    global_init();
    handle_ = curl_easy_init();
}

HttpSession::~HttpSession() {
    if (handle_) curl_easy_cleanup(static_cast<CURL*>(handle_));
}

HttpSession::HttpSession(HttpSession&& other) noexcept
    : handle_(std::exchange(other.handle_, nullptr)) {}

HttpSession& HttpSession::operator=(HttpSession&& other) noexcept {
    if (this != &other) {
        if (handle_) curl_easy_cleanup(static_cast<CURL*>(handle_));
        handle_ = std::exchange(other.handle_, nullptr);
    }
    return *this;
}

std::expected<HttpResponse, DownloadError>
HttpSession::head(const std::string& url) noexcept {
    auto* curl = static_cast<CURL*>(handle_);
    if (!curl) {
        return std::unexpected(DownloadError{make_error_code(DownloadErrc::network_error), "curl_easy_init failed"});
    }
    curl_easy_reset(curl);

    HttpResponse response{};
    char errbuf[CURL_ERROR_SIZE] = {};
    apply_common_options(curl, url, errbuf, &response.headers);
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);

    spdlog::debug("http: HEAD {}", url);
    CURLcode result = curl_easy_perform(curl);

    if (result == CURLE_HTTP_RETURNED_ERROR) {
        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
        return std::unexpected(status_error(http_code));
    }
    if (result != CURLE_OK) {
        return std::unexpected(curl_error(result, errbuf));
    }

    finish_response(curl, response);
    if (response.status_code < 200 || response.status_code >= 300) {
        return std::unexpected(status_error(response.status_code));
    }
    return response;
}

std::expected<HttpResponse, DownloadError>
HttpSession::get(const std::string& url,
                 const BodySink& sink,
                 std::optional<ByteRange> range) noexcept {
    auto* curl = static_cast<CURL*>(handle_);
    if (!curl) {
        return std::unexpected(DownloadError{make_error_code(DownloadErrc::network_error), "curl_easy_init failed"});
    }
    curl_easy_reset(curl);

    HttpResponse response{};
    char errbuf[CURL_ERROR_SIZE] = {};
    apply_common_options(curl, url, errbuf, &response.headers);

    // curl sends this as "Range: bytes=<first>-<last>"
    std::string range_spec;
    if (range) {
        range_spec = std::to_string(range->first) + "-" + std::to_string(range->last);
        curl_easy_setopt(curl, CURLOPT_RANGE, range_spec.c_str());
    }

    SinkContext ctx;
    ctx.sink = &sink;
    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(CURL_BUFFER_SIZE));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);

    spdlog::debug("http: GET {}{}", url, range ? " range=" + range_spec : std::string{});
    CURLcode result = curl_easy_perform(curl);

    if (result == CURLE_WRITE_ERROR && ctx.sink_error) {
        return std::unexpected(DownloadError{ctx.sink_error});
    }
    if (result == CURLE_HTTP_RETURNED_ERROR) {
        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
        return std::unexpected(status_error(http_code));
    }
    if (result != CURLE_OK) {
        return std::unexpected(curl_error(result, errbuf));
    }

    finish_response(curl, response);
    if (response.status_code < 200 || response.status_code >= 300) {
        return std::unexpected(status_error(response.status_code));
    }
    response.body_bytes = ctx.received;
    return response;
}

DownloadError HttpSession::status_error(long http_code) {
    std::string detail = "HTTP " + std::to_string(http_code);
    if (http_code == 404) {
        return {make_error_code(DownloadErrc::not_found), std::move(detail)};
    }
    if (http_code == 401 || http_code == 403) {
        return {make_error_code(DownloadErrc::permission_denied), std::move(detail)};
    }
    if (http_code == 416) {
        return {make_error_code(DownloadErrc::invalid_range), std::move(detail)};
    }
    if (http_code >= 500) {
        return {make_error_code(DownloadErrc::server_error), std::move(detail)};
    }
    return {make_error_code(DownloadErrc::http_error), std::move(detail)};
}

std::string HttpSession::parse_content_disposition(std::string_view content_disposition) {
    // "attachment; filename=file.zip" or filename="file.zip"
    auto filename_pos = content_disposition.find("filename=");
    if (filename_pos == std::string_view::npos) return {};

    auto filename = content_disposition.substr(filename_pos + 9);
    auto semi = filename.find(';');
    if (semi != std::string_view::npos) filename = filename.substr(0, semi);
    filename = trim(filename);
    if (filename.size() >= 2 && (filename.front() == '"' || filename.front() == '\'') &&
        filename.back() == filename.front()) {
        filename.remove_prefix(1);
        filename.remove_suffix(1);
    }
    return std::string(filename);
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace ferry::core
