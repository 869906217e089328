// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/cli/commands.hpp>
#include <ferry/cli/progress_bar.hpp>
#include <ferry/core/download_engine.hpp>
#include <ferry/core/http_session.hpp>
#include <ferry/disk/segment_store.hpp>
#include <ferry/stream/stream_supervisor.hpp>
#include <ferry/version.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <iostream>
#include <limits>
#include <type_traits>
#include <variant>

namespace ferry::cli {

using core::DownloadError;
using core::DownloadErrc;

namespace {

template<typename T>
bool parse_number(std::string_view text, T& out) noexcept {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

// Accepts plain bytes or a K/M/G suffix (binary units)
bool parse_size(std::string_view text, std::uint64_t& out) noexcept {
    std::uint64_t multiplier = 1;
    if (!text.empty()) {
        switch (text.back()) {
            case 'k': case 'K': multiplier = 1024; break;
            case 'm': case 'M': multiplier = 1024 * 1024; break;
            case 'g': case 'G': multiplier = 1024 * 1024 * 1024; break;
            default: break;
        }
        if (multiplier != 1) text.remove_suffix(1);
    }
    std::uint64_t value = 0;
    if (!parse_number(text, value) || value == 0) return false;
    if (value > std::numeric_limits<std::uint64_t>::max() / multiplier) return false;
    out = value * multiplier;
    return true;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto value_of = [&](int& i, std::string_view option) -> const char* {
        if (i + 1 < argc) return argv[++i];
        args.error = std::string(option) + " needs a value";
        return nullptr;
    };

    for (int i = 1; i < argc && args.error.empty(); ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-s" || arg == "--stream") {
            args.stream = true;
        } else if (arg == "-i" || arg == "--info") {
            args.info_only = true;
        } else if (arg == "--no-restart") {
            args.no_restart = true;
        } else if (arg == "-o" || arg == "--output") {
            if (auto v = value_of(i, arg)) args.output_file = v;
        } else if (arg == "-d" || arg == "--directory") {
            if (auto v = value_of(i, arg)) args.output_dir = v;
        } else if (arg == "--config") {
            if (auto v = value_of(i, arg)) args.config_path = v;
        } else if (arg == "-c" || arg == "--chunk-size") {
            if (auto v = value_of(i, arg); v && !parse_size(v, args.chunk_size)) {
                args.error = "invalid chunk size: " + std::string(v);
            }
        } else if (arg == "-j" || arg == "--jobs") {
            if (auto v = value_of(i, arg); v && (!parse_number(std::string_view(v), args.jobs) || args.jobs == 0)) {
                args.error = "invalid job count: " + std::string(v);
            }
        } else if (arg == "--stall-timeout") {
            std::uint32_t sec = 0;
            if (auto v = value_of(i, arg)) {
                if (!parse_number(std::string_view(v), sec) || sec == 0) {
                    args.error = "invalid stall timeout: " + std::string(v);
                } else {
                    args.stall_timeout_sec = sec;
                }
            }
        } else if (arg == "--max-restarts") {
            std::uint32_t n = 0;
            if (auto v = value_of(i, arg)) {
                if (!parse_number(std::string_view(v), n)) {
                    args.error = "invalid restart count: " + std::string(v);
                } else {
                    args.max_restarts = n;
                }
            }
        } else if (arg.size() > 1 && arg.front() == '-') {
            args.error = "unknown option: " + std::string(arg);
        } else {
            args.urls.emplace_back(arg);
        }
    }

    if (args.error.empty() && !args.output_file.empty() && args.urls.size() > 1) {
        args.error = "-o/--output needs exactly one URL";
    }
    return args;
}

void apply_overrides(const CliArgs& args, core::Settings& settings) noexcept {
    if (args.chunk_size > 0) settings.chunk_size = args.chunk_size;
    if (args.jobs > 0) settings.max_concurrent_chunks = args.jobs;
    if (args.stall_timeout_sec) settings.stall_timeout = std::chrono::seconds(*args.stall_timeout_sec);
    if (args.no_restart) settings.auto_restart = false;
    if (args.max_restarts) settings.max_restarts = *args.max_restarts;
}

std::string default_filename(std::string_view url) {
    auto scheme = url.find("://");
    std::string_view path = url;
    if (scheme != std::string_view::npos) {
        auto rest = url.substr(scheme + 3);
        auto slash = rest.find('/');
        path = slash == std::string_view::npos ? std::string_view{} : rest.substr(slash);
    }

    auto cut = path.find_first_of("?#");
    if (cut != std::string_view::npos) path = path.substr(0, cut);

    auto last = path.rfind('/');
    auto name = last == std::string_view::npos ? path : path.substr(last + 1);
    if (name.empty() || name == "." || name == "..") {
        return "index.html";
    }
    return std::string(name);
}

std::filesystem::path resolve_output(const CliArgs& args, const std::string& url) {
    std::filesystem::path name = args.output_file.empty()
        ? std::filesystem::path(default_filename(url))
        : std::filesystem::path(args.output_file);
    if (!args.output_dir.empty() && name.is_relative()) {
        return std::filesystem::path(args.output_dir) / name;
    }
    return name;
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const std::string& url,
                   const std::filesystem::path& output,
                   const core::Settings& settings,
                   bool quiet) {
    core::DownloadEngine engine(settings.engine_config());

    ProgressBar bar(0, "Downloading");
    if (!quiet) {
        engine.callback([&bar](const core::ProgressEvent& ev) {
            std::visit([&bar](const auto& e) {
                using E = std::decay_t<decltype(e)>;
                if constexpr (std::is_same_v<E, core::event::Started>) {
                    bar.total(e.total_size);
                } else if constexpr (std::is_same_v<E, core::event::Progress>) {
                    bar.total(e.total);
                    bar.update(e.downloaded, e.speed.value_or(0));
                } else if constexpr (std::is_same_v<E, core::event::Merging>) {
                    bar.status("Merging");
                } else if constexpr (std::is_same_v<E, core::event::Completed>) {
                    bar.finish();
                } else if constexpr (std::is_same_v<E, core::event::Error>) {
                    bar.clear();
                }
            }, ev);
        });
    }

    auto result = engine.run(core::DownloadTask{url, output, 0, settings.chunk_size});
    if (!result) {
        std::cerr << "Error: " << result.error().message() << std::endl;

        if (settings.remove_on_error) {
            auto removed = disk::SegmentStore::purge(output);
            spdlog::info("Removed {} temporary file(s) for {}", removed, output.string());
        } else if (result.error().is_chunk_failure()) {
            std::cerr << "Partial download kept; run again to resume." << std::endl;
        }
        return std::unexpected(result.error());
    }

    if (!quiet) {
        std::cout << "Saved " << output.string() << std::endl;
    }
    return {};
}

CliResult stream(const std::string& url,
                 const std::filesystem::path& output,
                 const core::Settings& settings,
                 bool quiet) {
    ferry::stream::DownloadOptions options;
    options.stall_timeout = settings.stall_timeout;
    options.auto_restart = settings.auto_restart;
    options.max_restarts = settings.max_restarts;

    ferry::stream::StreamSupervisor supervisor(options, settings.stream_program);

    Spinner spinner("Recording");
    if (!quiet) {
        supervisor.callback([&spinner](const ferry::stream::StreamProgressSample& sample) {
            auto it = sample.find("out_time_ms");
            if (it == sample.end()) {
                spinner.update();
                return;
            }
            // Despite the name, ffmpeg reports microseconds here
            std::uint64_t us = 0;
            if (parse_number(std::string_view(it->second), us)) {
                spinner.update(format_time(us / 1'000'000));
            } else {
                spinner.update(it->second);
            }
        });
    }

    auto result = supervisor.run(url, output);
    if (!quiet) spinner.clear();
    if (!result) {
        std::cerr << "Error: " << result.error().message() << std::endl;
        return std::unexpected(result.error());
    }

    if (!quiet) {
        std::cout << "Saved " << output.string() << std::endl;
    }
    return {};
}

CliResult info(const std::string& url) {
    core::HttpSession session;
    auto response = session.head(url);
    if (!response) {
        std::cerr << "Error: " << response.error().message() << std::endl;
        return std::unexpected(response.error());
    }

    std::cout << "URL: " << url << std::endl;
    std::cout << "Status: " << response->status_code << std::endl;
    std::cout << "Content-Type: " << response->content_type << std::endl;
    if (response->content_length) {
        std::cout << "Content-Length: " << *response->content_length
                  << " (" << format_bytes(*response->content_length) << ")" << std::endl;
    } else {
        std::cout << "Content-Length: unknown" << std::endl;
    }
    std::cout << "Accepts-Ranges: " << (response->accepts_ranges ? "yes" : "no") << std::endl;
    if (!response->filename.empty()) {
        std::cout << "Filename: " << response->filename << std::endl;
    }
    return {};
}

void print_help(std::string_view program_name) {
    std::cout << "ferry " << program_name << " - resumable segmented downloads and stream capture\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL>...\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "  -v, --version            Show version information\n";
    std::cout << "  -V, --verbose            Debug logging\n";
    std::cout << "  -q, --quiet              No progress output\n";
    std::cout << "  -o, --output <FILE>      Save to specified file (single URL)\n";
    std::cout << "  -d, --directory <DIR>    Save into directory\n";
    std::cout << "  -c, --chunk-size <SIZE>  Chunk size, e.g. 8M (default: 8M)\n";
    std::cout << "  -j, --jobs <N>           Concurrent chunk downloads (default: 4)\n";
    std::cout << "  -i, --info               Show file info without downloading\n";
    std::cout << "      --config <FILE>      Settings file (default: ferry.json)\n";
    std::cout << "\n";
    std::cout << "STREAM OPTIONS:\n";
    std::cout << "  -s, --stream             Capture a live stream with ffmpeg\n";
    std::cout << "      --stall-timeout <S>  Kill after S seconds without progress (default: 20)\n";
    std::cout << "      --max-restarts <N>   Attempts before giving up (default: 3)\n";
    std::cout << "      --no-restart         Fail on the first error\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/file.zip\n";
    std::cout << "  " << program_name << " -o image.iso -j 8 https://example.com/large.iso\n";
    std::cout << "  " << program_name << " -s -o show.mp4 https://example.com/live/index.m3u8\n";
}

void print_version() {
    std::cout << "ferry " << ferry::version.to_string() << std::endl;
    std::cout << "Built " << BUILD_DATE << " " << BUILD_TIME << " with libcurl, Boost.Asio, spdlog\n";
}

} // namespace ferry::cli
