/*
 * Executable resolution implementation - CLI-Gateway
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <cli-gateway/exec/path.hpp>
#include <cstdlib>
#include <sstream>
#include <unistd.h>
#include <sys/stat.h>

namespace cligate {

static bool is_executable_file(const std::string& p) {
    struct stat st{};
    if (stat(p.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return access(p.c_str(), X_OK) == 0;
}

std::optional<std::string> resolve_executable(const std::string& cmd) {
    if (cmd.empty()) return std::nullopt;
    if (cmd.find('/') != std::string::npos) {
        if (is_executable_file(cmd)) return cmd;
        return std::nullopt;
    }
    const char* path_env = std::getenv("PATH");
    std::string paths = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
    std::stringstream ss(paths);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string full = dir + '/' + cmd;
        if (is_executable_file(full)) return full;
    }
    return std::nullopt;
}

} // namespace cligate
