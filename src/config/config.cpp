/*
 * Gateway configuration implementation - CLI-Gateway
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <cli-gateway/config/config.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace cligate {

static std::string trim(const std::string& s) {
    size_t a = 0; while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    size_t b = s.size(); while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    return s.substr(a, b-a);
}

static bool parse_bool(const std::string& v) { return v == "1" || v == "true" || v == "on" || v == "yes"; }

std::string default_config_path() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::string(home) + "/.cli-gatewayrc";
}

void parse_config(std::istream& in, GatewayConfig& cfg) {
    std::string line; size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) { spdlog::warn("config line {}: missing '='", lineno); continue; }
        auto key = trim(line.substr(0, eq)); auto val = trim(line.substr(eq+1));
        try {
            if (key == "log_level") cfg.log_level = val;
            else if (key == "color") cfg.color = parse_bool(val);
            else if (key == "max_log_lines") {
                long n = std::stol(val);
                if (n < 0) throw std::out_of_range("negative");
                cfg.max_log_lines = static_cast<std::size_t>(n);
            }
            else if (key == "stop_timeout_ms") cfg.stop_timeout = std::chrono::milliseconds(std::max(0L, std::stol(val)));
            else if (key == "poll_interval_ms") cfg.poll_interval = std::chrono::milliseconds(std::max(1L, std::stol(val)));
            else spdlog::debug("config line {}: unknown key '{}'", lineno, key);
        } catch (const std::exception& e) {
            spdlog::warn("config line {}: invalid value '{}' for '{}' ({})", lineno, val, key, e.what());
        }
    }
}

GatewayConfig load_config(const std::string& path) {
    GatewayConfig cfg;
    if (path.empty()) return cfg;
    std::ifstream in(path);
    if (!in) { spdlog::debug("no config at '{}', using defaults", path); return cfg; }
    parse_config(in, cfg);
    return cfg;
}

} // namespace cligate
