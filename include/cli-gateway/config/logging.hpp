/*
 * Logging setup - CLI-Gateway
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <spdlog/common.h>
#include <string>

namespace cligate {

// trace|debug|info|warn|error|off, case-insensitive; anything else is info.
spdlog::level::level_enum parse_log_level(const std::string& name);

// Installs the "cli-gateway" stderr logger as spdlog's default.
void init_logging(const std::string& level, bool color = true);

} // namespace cligate
