// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ferry::core {

// A file to fetch. Must not change once chunk planning has begun.
struct DownloadTask {
    std::string url;
    std::filesystem::path output;
    std::uint64_t total_size{0};     // 0 = unknown, ask with HEAD
    std::uint64_t chunk_size{0};     // Must be > 0
};

// A contiguous byte range [start, end] (both inclusive) stored in its own part file
struct Chunk {
    std::uint32_t index{0};
    std::uint64_t start{0};
    std::uint64_t end{0};
    std::filesystem::path path;         // <stem>.part<index>
    std::filesystem::path marker_path;  // <stem>.part<index>.done

    [[nodiscard]] std::uint64_t length() const noexcept { return end - start + 1; }
};

// Deterministic part-file path for chunk `index` of `output`
[[nodiscard]] std::filesystem::path part_path(const std::filesystem::path& output,
                                              std::uint32_t index);

// Completion marker path for a part file
[[nodiscard]] std::filesystem::path marker_path(const std::filesystem::path& part);

// Split [0, total_size) into ordered, contiguous chunks of chunk_size bytes.
// The last chunk may be shorter. Returns an empty list if either size is 0.
[[nodiscard]] std::vector<Chunk> plan_chunks(const std::filesystem::path& output,
                                             std::uint64_t total_size,
                                             std::uint64_t chunk_size);

[[nodiscard]] inline std::vector<Chunk> plan_chunks(const DownloadTask& task) {
    return plan_chunks(task.output, task.total_size, task.chunk_size);
}

} // namespace ferry::core
