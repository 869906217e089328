// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/logging.hpp>
#include <ferry/core/config.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>

namespace ferry::core {

namespace {

std::optional<spdlog::level::level_enum> parse_level(const std::string& name) noexcept {
    if (name.empty()) return std::nullopt;
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && name != "off") return std::nullopt;
    return level;
}

} // namespace

spdlog::level::level_enum
resolve_log_level(const std::string& configured, const char* env_value) noexcept {
    if (auto level = parse_level(configured)) {
        return *level;
    }
    if (env_value) {
        if (auto level = parse_level(env_value)) {
            return *level;
        }
    }
    return spdlog::level::info;
}

void init_logging(const std::string& configured_level,
                  std::optional<spdlog::level::level_enum> override_level) {
    auto logger = spdlog::get("ferry");
    if (!logger) {
        logger = spdlog::stderr_color_mt("ferry");
    }
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    const std::string env_name(LOG_LEVEL_ENV);
    auto level = override_level
        ? *override_level
        : resolve_log_level(configured_level, std::getenv(env_name.c_str()));
    logger->set_level(level);
    spdlog::set_default_logger(logger);
}

} // namespace ferry::core
