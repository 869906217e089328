// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/common.h>
#include <optional>
#include <string>

namespace ferry::core {

// Pick the log level: configured value, else $FERRY_LOG, else info.
// Unknown names are ignored.
[[nodiscard]] spdlog::level::level_enum
resolve_log_level(const std::string& configured, const char* env_value) noexcept;

// Install the "ferry" stderr logger as spdlog's default.
// `override_level` (from -V/-q) beats everything else.
void init_logging(const std::string& configured_level,
                  std::optional<spdlog::level::level_enum> override_level = std::nullopt);

} // namespace ferry::core
