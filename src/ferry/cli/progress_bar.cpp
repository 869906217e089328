// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace ferry::cli {

namespace {

const char* SPINNER_FRAMES[] = {"-", "\\", "|", "/"};

constexpr int BAR_WIDTH = 30;

std::string scaled(double value, int precision, const char* unit) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value << ' ' << unit;
    return ss.str();
}

} // namespace

//=============================================================================
// Formatting
//=============================================================================

std::string format_bytes(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = 1024.0 * KB;
    constexpr double GB = 1024.0 * MB;
    constexpr double TB = 1024.0 * GB;

    const auto b = static_cast<double>(bytes);
    if (b >= TB) return scaled(b / TB, 2, "TB");
    if (b >= GB) return scaled(b / GB, 2, "GB");
    if (b >= MB) return scaled(b / MB, 1, "MB");
    if (b >= KB) return scaled(b / KB, 0, "KB");
    return std::to_string(bytes) + " B";
}

std::string format_speed(std::uint64_t bps) {
    return format_bytes(bps) + "/s";
}

std::string format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        std::ostringstream ss;
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes << "m";
        return ss.str();
    }
    if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::uint64_t total, std::string_view label)
    : total_(total)
    , label_(label) {}

void ProgressBar::update(std::uint64_t current, std::uint64_t speed_bps) {
    current_ = current;
    if (total_ == 0 || finished_) return;

    // Redraw at most once per percent
    int percent = static_cast<int>(std::clamp(
        static_cast<double>(current) * 100.0 / static_cast<double>(total_), 0.0, 100.0));
    if (percent == last_percent_) return;
    last_percent_ = percent;

    draw(current, speed_bps);
}

void ProgressBar::status(std::string_view label) {
    label_ = label;
    if (total_ > 0 && !finished_) draw(current_, 0);
}

void ProgressBar::draw(std::uint64_t current, std::uint64_t speed_bps) {
    double percent = total_ == 0 ? 100.0
        : std::clamp(static_cast<double>(current) * 100.0 / static_cast<double>(total_), 0.0, 100.0);

    std::string line = "\r";
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    const int filled = static_cast<int>(std::round(BAR_WIDTH * percent / 100.0));
    line += '[';
    line.append(static_cast<std::size_t>(filled), '=');
    line += '>';
    line.append(static_cast<std::size_t>(BAR_WIDTH - filled), ' ');
    line += "] ";

    std::ostringstream pct;
    pct << std::setw(3) << static_cast<int>(percent) << '%';
    line += pct.str();

    line += " (" + format_bytes(current) + "/" + format_bytes(total_) + ")";

    if (speed_bps > 0) {
        line += " @ " + format_speed(speed_bps);
        if (current < total_) {
            line += " ETA: " + format_time((total_ - current) / speed_bps);
        }
    }

    line += std::string(10, ' ');
    std::cout << line << std::flush;
}

void ProgressBar::finish() {
    if (finished_) return;
    draw(total_, 0);
    finished_ = true;
    std::cout << std::endl;
}

void ProgressBar::clear() {
    std::cout << "\r" << std::string(100, ' ') << "\r" << std::flush;
}

//=============================================================================
// Spinner
//=============================================================================

Spinner::Spinner(std::string_view label)
    : label_(label) {}

void Spinner::update(std::string_view detail) {
    std::string line = "\r";
    line += SPINNER_FRAMES[frame_ % 4];
    line += ' ';
    line += label_;
    if (!detail.empty()) {
        line += ' ';
        line += detail;
    }
    // Pad over a longer previous frame
    std::size_t width = line.size();
    if (width < last_width_) line.append(last_width_ - width, ' ');
    last_width_ = width;

    std::cout << line << std::flush;
    ++frame_;
}

void Spinner::finish() {
    clear();
    std::cout << label_ << " done" << std::endl;
}

void Spinner::clear() {
    std::cout << "\r" << std::string(last_width_, ' ') << "\r" << std::flush;
}

} // namespace ferry::cli
