// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace ferry::stream {

// Accumulated "key=value" fields of the supervised program's progress output.
// Keys and values are passed through untouched.
using StreamProgressSample = std::map<std::string, std::string>;

// Line-oriented parser for "-progress pipe:1" style records.
//
// Fields accumulate across records; nothing is ever cleared. feed() returns
// the running sample when it should be delivered:
//   - after a key that signals forward progress (out_time_ms, progress)
//   - on a blank line, if anything has been seen
class ProgressParser {
public:
    [[nodiscard]] std::optional<StreamProgressSample> feed(std::string_view line);

    [[nodiscard]] const StreamProgressSample& current() const noexcept { return sample_; }
    [[nodiscard]] bool empty() const noexcept { return sample_.empty(); }

    [[nodiscard]] static bool is_progress_key(std::string_view key) noexcept;

private:
    StreamProgressSample sample_;
};

} // namespace ferry::stream
