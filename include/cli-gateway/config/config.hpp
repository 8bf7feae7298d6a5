/*
 * Gateway configuration - CLI-Gateway
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <istream>
#include <string>

namespace cligate {

struct GatewayConfig {
    std::string log_level = "info";
    std::size_t max_log_lines = 1000;                  // per stream per session, 0 = unbounded
    std::chrono::milliseconds stop_timeout{5000};      // wait for exit after SIGKILL
    std::chrono::milliseconds poll_interval{20};       // exit polling
    bool color = true;
};

// $HOME/.cli-gatewayrc, or empty if HOME is unset.
std::string default_config_path();

// key=value lines; '#' comments. Unknown keys and malformed values are
// logged and skipped, keeping the defaults.
void parse_config(std::istream& in, GatewayConfig& cfg);
// Missing file is not an error: returns the defaults.
GatewayConfig load_config(const std::string& path);

} // namespace cligate
