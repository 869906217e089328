// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace ferry::cli {

// Single-line progress bar on stdout
class ProgressBar {
public:
    explicit ProgressBar(std::uint64_t total = 0, std::string_view label = {});

    void update(std::uint64_t current, std::uint64_t speed_bps = 0);

    // Replace the bar's label (e.g. "Merging")
    void status(std::string_view label);

    void finish();
    void clear();

    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }
    void total(std::uint64_t t) noexcept { total_ = t; }

private:
    void draw(std::uint64_t current, std::uint64_t speed_bps);

    std::uint64_t total_{0};
    std::uint64_t current_{0};
    int last_percent_{-1};
    std::string label_;
    bool finished_{false};
};

// Spinner for streams of unknown length
class Spinner {
public:
    explicit Spinner(std::string_view label = {});

    // Advance one frame and show `detail` after the label
    void update(std::string_view detail = {});
    void finish();
    void clear();

private:
    std::size_t frame_{0};
    std::string label_;
    std::size_t last_width_{0};
};

[[nodiscard]] std::string format_bytes(std::uint64_t bytes);
[[nodiscard]] std::string format_speed(std::uint64_t bps);
[[nodiscard]] std::string format_time(std::uint64_t seconds);

} // namespace ferry::cli
