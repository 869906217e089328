// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/chunk.hpp>
#include <ferry/core/error.hpp>
#include <ferry/core/http_session.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>

namespace ferry::core {

// Called with the size of each block written to the part file
using ByteCounter = std::function<void(std::uint64_t bytes)>;

// Downloads one chunk's byte range into its part file.
// The part file is truncated first: a retried chunk starts over from its
// first byte. Failures carry the chunk index and are never retried here.
class RangeFetcher {
public:
    RangeFetcher() = default;

    [[nodiscard]] std::expected<void, DownloadError>
    fetch(const std::string& url, const Chunk& chunk, const ByteCounter& on_bytes = {}) noexcept;

private:
    HttpSession session_;
};

} // namespace ferry::core
