/*
 * Executable resolution - CLI-Gateway
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <optional>

namespace cligate {

// Resolve a command name to an executable path. Names containing '/' are
// checked in place; anything else is searched along PATH.
std::optional<std::string> resolve_executable(const std::string& cmd);

} // namespace cligate
