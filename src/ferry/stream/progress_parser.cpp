// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/stream/progress_parser.hpp>

namespace ferry::stream {

namespace {

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) {
        s.remove_suffix(1);
    }
    return s;
}

} // namespace

bool ProgressParser::is_progress_key(std::string_view key) noexcept {
    return key == "out_time_ms" || key == "progress";
}

std::optional<StreamProgressSample> ProgressParser::feed(std::string_view line) {
    line = trim(line);

    // Record boundary
    if (line.empty()) {
        if (sample_.empty()) return std::nullopt;
        return sample_;
    }

    auto eq = line.find('=');
    if (eq == std::string_view::npos) {
        return std::nullopt;
    }

    auto key = trim(line.substr(0, eq));
    auto value = trim(line.substr(eq + 1));
    if (key.empty()) {
        return std::nullopt;
    }

    sample_[std::string(key)] = std::string(value);

    if (is_progress_key(key)) {
        return sample_;
    }
    return std::nullopt;
}

} // namespace ferry::stream
