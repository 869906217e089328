// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/disk/segment_store.hpp>
#include <ferry/disk/file_writer.hpp>
#include <ferry/core/config.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace ferry::disk {

namespace fs = std::filesystem;

namespace {

// Matches "<stem>.part<digits>" or "<stem>.part<digits>.done"
bool is_segment_file(std::string_view name, std::string_view prefix) {
    if (name.size() <= prefix.size() || name.substr(0, prefix.size()) != prefix) {
        return false;
    }

    auto rest = name.substr(prefix.size());
    if (rest.size() > core::DONE_SUFFIX.size()
        && rest.substr(rest.size() - core::DONE_SUFFIX.size()) == core::DONE_SUFFIX) {
        rest.remove_suffix(core::DONE_SUFFIX.size());
    }

    return !rest.empty() && std::all_of(rest.begin(), rest.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

} // namespace

std::error_code SegmentStore::ensure(const core::Chunk& chunk) noexcept {
    std::error_code ec;
    if (fs::exists(chunk.path, ec)) {
        return {};
    }
    if (ec) {
        return ec;
    }

    auto file = FileWriter::open(chunk.path.string());
    if (!file) {
        return file.error();
    }
    if (auto err = file->pre_allocate(chunk.length())) {
        return err;
    }
    return file->close();
}

std::error_code SegmentStore::ensure(const std::vector<core::Chunk>& chunks) noexcept {
    for (const auto& chunk : chunks) {
        if (auto ec = ensure(chunk)) {
            spdlog::error("Cannot prepare part file {}: {}", chunk.path.string(), ec.message());
            return ec;
        }
    }
    return {};
}

bool SegmentStore::is_complete(const core::Chunk& chunk) noexcept {
    std::error_code ec;
    return fs::exists(chunk.marker_path, ec);
}

std::error_code SegmentStore::mark_complete(const core::Chunk& chunk) noexcept {
    auto marker = FileWriter::open(chunk.marker_path.string());
    if (!marker) {
        return marker.error();
    }
    return marker->close();
}

std::error_code SegmentStore::remove(const std::vector<core::Chunk>& chunks) noexcept {
    std::error_code first_error;
    for (const auto& chunk : chunks) {
        for (const auto& path : {chunk.path, chunk.marker_path}) {
            std::error_code ec;
            fs::remove(path, ec);
            if (ec) {
                spdlog::warn("Cannot remove {}: {}", path.string(), ec.message());
                if (!first_error) {
                    first_error = make_error_code(DiskErrc::remove_error);
                }
            }
        }
    }
    return first_error;
}

std::size_t SegmentStore::purge(const fs::path& output) noexcept {
    fs::path dir = output.parent_path();
    if (dir.empty()) {
        dir = ".";
    }

    std::string prefix;
    std::vector<fs::path> doomed;
    try {
        prefix = output.stem().string() + std::string(core::PART_SUFFIX);
        for (const auto& entry : fs::directory_iterator(dir)) {
            if (entry.is_regular_file() && is_segment_file(entry.path().filename().string(), prefix)) {
                doomed.push_back(entry.path());
            }
        }
    } catch (const fs::filesystem_error& e) {
        spdlog::warn("Cannot scan {} for part files: {}", dir.string(), e.what());
        return 0;
    }

    std::size_t removed = 0;
    for (const auto& path : doomed) {
        std::error_code ec;
        if (fs::remove(path, ec)) {
            spdlog::debug("Removed {}", path.string());
            ++removed;
        } else if (ec) {
            spdlog::warn("Cannot remove {}: {}", path.string(), ec.message());
        }
    }
    return removed;
}

} // namespace ferry::disk
