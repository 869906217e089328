// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/chunk.hpp>
#include <ferry/core/config.hpp>
#include <utility>

namespace ferry::core {

std::filesystem::path part_path(const std::filesystem::path& output, std::uint32_t index) {
    std::filesystem::path part = output;
    part.replace_extension(std::string(PART_SUFFIX) + std::to_string(index));
    return part;
}

std::filesystem::path marker_path(const std::filesystem::path& part) {
    std::filesystem::path marker = part;
    marker += DONE_SUFFIX;
    return marker;
}

std::vector<Chunk> plan_chunks(const std::filesystem::path& output,
                               std::uint64_t total_size,
                               std::uint64_t chunk_size) {
    std::vector<Chunk> chunks;
    if (total_size == 0 || chunk_size == 0) {
        return chunks;
    }

    chunks.reserve(static_cast<std::size_t>(total_size / chunk_size + (total_size % chunk_size != 0)));

    std::uint64_t start = 0;
    std::uint32_t index = 0;
    while (start < total_size) {
        // min(start + chunk_size - 1, total_size - 1) without overflow
        std::uint64_t end = (total_size - 1 - start < chunk_size - 1)
            ? total_size - 1
            : start + (chunk_size - 1);

        Chunk chunk;
        chunk.index = index;
        chunk.start = start;
        chunk.end = end;
        chunk.path = part_path(output, index);
        chunk.marker_path = marker_path(chunk.path);
        chunks.push_back(std::move(chunk));

        ++index;
        start = end + 1;
    }

    return chunks;
}

} // namespace ferry::core
