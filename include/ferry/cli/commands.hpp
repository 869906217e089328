// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/error.hpp>
#include <ferry/core/settings.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::cli {

// CLI result
using CliResult = std::expected<void, core::DownloadError>;

// Command line arguments
struct CliArgs {
    std::vector<std::string> urls;
    std::string output_dir;
    std::string output_file;
    std::string config_path;
    std::uint64_t chunk_size{0};                 // 0 = from settings
    std::uint32_t jobs{0};                       // 0 = from settings
    bool stream{false};
    std::optional<std::uint32_t> stall_timeout_sec;
    bool no_restart{false};
    std::optional<std::uint32_t> max_restarts;
    bool info_only{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;                           // Set when parsing failed
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// Command-line overrides applied on top of the loaded settings
void apply_overrides(const CliArgs& args, core::Settings& settings) noexcept;

// Last path segment of `url`; "index.html" for directory URLs
[[nodiscard]] std::string default_filename(std::string_view url);

// Output path for `url` from -o/-d and the URL itself
[[nodiscard]] std::filesystem::path resolve_output(const CliArgs& args, const std::string& url);

// Segmented (or whole-file) HTTP download
[[nodiscard]] CliResult download(const std::string& url,
                                 const std::filesystem::path& output,
                                 const core::Settings& settings,
                                 bool quiet);

// Supervised stream copy
[[nodiscard]] CliResult stream(const std::string& url,
                               const std::filesystem::path& output,
                               const core::Settings& settings,
                               bool quiet);

// HEAD the URL and print what the server reports
[[nodiscard]] CliResult info(const std::string& url);

void print_help(std::string_view program_name);
void print_version();

} // namespace ferry::cli
