/*
 * Target normalization implementation - CLI-Gateway
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <cli-gateway/exec/target.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace cligate {
namespace fs = std::filesystem;

std::string normalize_target(const std::string& target) {
    if (target.empty()) return {};
    std::string s = target;
    std::replace(s.begin(), s.end(), '\\', '/');
    std::error_code ec;
    fs::path p = fs::absolute(fs::path(s), ec);
    if (ec) {
        spdlog::debug("normalize_target: keeping '{}' as-is ({})", s, ec.message());
        return s;
    }
    std::string out = p.lexically_normal().generic_string();
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

} // namespace cligate
