// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/cli/commands.hpp>
#include <ferry/core/config.hpp>
#include <ferry/core/http_session.hpp>
#include <ferry/core/logging.hpp>
#include <ferry/core/settings.hpp>
#include <iostream>
#include <optional>

using namespace ferry::cli;

int main(int argc, char* argv[]) {
    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }

    if (args.version) {
        print_version();
        return 0;
    }

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return 1;
    }

    // Need at least one URL
    if (args.urls.empty()) {
        std::cerr << "Error: No URL specified" << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return 1;
    }

    std::filesystem::path config_path = args.config_path.empty()
        ? std::filesystem::path(ferry::core::DEFAULT_CONFIG_FILE)
        : std::filesystem::path(args.config_path);

    auto settings = ferry::core::Settings::load(config_path);
    if (!settings) {
        std::cerr << "Error: " << settings.error().message() << std::endl;
        return 1;
    }
    apply_overrides(args, *settings);

    std::optional<spdlog::level::level_enum> level;
    if (args.verbose) level = spdlog::level::debug;
    else if (args.quiet) level = spdlog::level::warn;
    ferry::core::init_logging(settings->log_level, level);

    ferry::core::HttpSession::global_init();

    int exit_code = 0;
    for (const auto& url : args.urls) {
        CliResult result;
        if (args.info_only) {
            result = info(url);
        } else if (args.stream) {
            result = stream(url, resolve_output(args, url), *settings, args.quiet);
        } else {
            result = download(url, resolve_output(args, url), *settings, args.quiet);
        }
        if (!result) {
            exit_code = 1;
        }
    }

    ferry::core::HttpSession::global_cleanup();
    return exit_code;
}
