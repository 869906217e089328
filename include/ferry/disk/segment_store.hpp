// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/chunk.hpp>
#include <ferry/disk/error.hpp>
#include <cstddef>
#include <filesystem>
#include <vector>

namespace ferry::disk {

// On-disk footprint of a segmented download: one preallocated part file
// per chunk plus an empty ".done" marker once that chunk is complete.
// Markers are the only resume state; nothing else is persisted.
class SegmentStore {
public:
    // Create any missing part file at exactly chunk.length() bytes.
    // Existing part files are left untouched.
    [[nodiscard]] static std::error_code ensure(const core::Chunk& chunk) noexcept;
    [[nodiscard]] static std::error_code ensure(const std::vector<core::Chunk>& chunks) noexcept;

    [[nodiscard]] static bool is_complete(const core::Chunk& chunk) noexcept;

    // Create the empty completion marker
    [[nodiscard]] static std::error_code mark_complete(const core::Chunk& chunk) noexcept;

    // Delete part files and markers of the given chunks (missing files are fine)
    [[nodiscard]] static std::error_code remove(const std::vector<core::Chunk>& chunks) noexcept;

    // Delete every <stem>.part<N> and <stem>.part<N>.done next to `output`,
    // whatever chunk plan produced them. Returns the number of files removed.
    static std::size_t purge(const std::filesystem::path& output) noexcept;
};

} // namespace ferry::disk
