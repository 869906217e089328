// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace ferry::core {

namespace event {

struct Started {
    std::uint64_t total_size{0};    // 0 when unknown
};

struct Progress {
    std::uint64_t downloaded{0};
    std::uint64_t total{0};
    std::optional<std::uint64_t> speed;  // bytes/s since the previous event
};

struct Merging {};
struct Completed {};

struct Error {
    std::string message;
};

// Reserved for front ends that layer pause/cancel on top of the engine
struct Paused {};
struct Cancelled {};

} // namespace event

using ProgressEvent = std::variant<event::Started,
                                   event::Progress,
                                   event::Merging,
                                   event::Completed,
                                   event::Error,
                                   event::Paused,
                                   event::Cancelled>;

// Invoked from worker threads, serialized by the emitter
using ProgressCallback = std::function<void(const ProgressEvent&)>;

} // namespace ferry::core
