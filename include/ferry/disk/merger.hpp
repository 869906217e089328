// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/disk/error.hpp>
#include <filesystem>
#include <vector>

namespace ferry::disk {

// Create/truncate `output` and append every file of `parts` in order,
// byte for byte. An empty list yields an empty output file. A missing
// part aborts immediately with DiskErrc::file_not_found.
[[nodiscard]] std::error_code merge_files(const std::vector<std::filesystem::path>& parts,
                                          const std::filesystem::path& output) noexcept;

} // namespace ferry::disk
