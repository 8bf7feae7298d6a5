/*
 * Logging setup implementation - CLI-Gateway
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <cli-gateway/config/logging.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <memory>

namespace cligate {

spdlog::level::level_enum parse_log_level(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c) { return std::tolower(c); });
    if (n == "trace") return spdlog::level::trace;
    if (n == "debug") return spdlog::level::debug;
    if (n == "info") return spdlog::level::info;
    if (n == "warn" || n == "warning") return spdlog::level::warn;
    if (n == "error") return spdlog::level::err;
    if (n == "off") return spdlog::level::off;
    spdlog::warn("unknown log level '{}', using info", name);
    return spdlog::level::info;
}

void init_logging(const std::string& level, bool color) {
    auto mode = color ? spdlog::color_mode::automatic : spdlog::color_mode::never;
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>(mode);
    auto logger = std::make_shared<spdlog::logger>("cli-gateway", sink);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->set_level(parse_log_level(level));
    spdlog::set_default_logger(logger);
}

} // namespace cligate
