/*
 * Process session registry - CLI-Gateway
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <cli-gateway/exec/log_buffer.hpp>
#include <cli-gateway/exec/process.hpp>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cligate {

struct SessionInfo {
    std::string session_id;
    pid_t pid = -1;
    std::string operation_kind;
    std::string target;
    std::chrono::system_clock::time_point started_at;
    bool running = false;             // probed at call time
    std::optional<int> exit_code;
};

struct SessionLogs {
    std::string session_id;
    std::string operation_kind;
    std::string target;
    std::chrono::system_clock::time_point started_at;
    bool running = false;
    std::vector<LogLine> output_lines;
    std::vector<LogLine> error_lines;
    std::size_t total_output_lines = 0; // retained, before filtering
    std::size_t total_error_lines = 0;
};

struct StopResult {
    bool stopped = false;
    bool found = false;
    std::string error; // set when stopped == false
};

// Tracks long-running processes by caller-chosen id. A session is Running
// until its process exits (naturally or via try_stop_session), stays
// queryable while Exited, and is gone once removed by cleanup, remove or clear.
class ProcessSessionRegistry {
public:
    explicit ProcessSessionRegistry(std::size_t max_log_lines_per_stream = 1000,
                                    std::chrono::milliseconds stop_timeout = std::chrono::seconds(5));
    ~ProcessSessionRegistry();
    ProcessSessionRegistry(const ProcessSessionRegistry&) = delete;
    ProcessSessionRegistry& operator=(const ProcessSessionRegistry&) = delete;

    // Throws std::invalid_argument on a blank id or null process. Returns
    // false on a duplicate id, in which case `process` is left untouched
    // with the caller. On success the registry owns the process and starts
    // capturing its output.
    bool register_session(const std::string& session_id, std::unique_ptr<Process>&& process,
                          const std::string& operation_kind, const std::string& target);

    // Kills the whole process tree. The session stays registered (Exited).
    // If the OS refuses the kill the session is marked abandoned: it is
    // reported as not running and cleanup removes it.
    StopResult try_stop_session(const std::string& session_id);
    // Stop, then drop the session and its logs.
    StopResult try_remove_session(const std::string& session_id);

    std::optional<SessionInfo> try_get_session(const std::string& session_id) const;
    // Every registered session, running or not, oldest first.
    std::vector<SessionInfo> active_sessions() const;
    std::size_t active_session_count() const;

    // Removes every session whose process has exited; returns how many.
    int cleanup_completed_sessions();
    void clear();

    std::optional<SessionLogs> session_logs(const std::string& session_id,
                                            std::optional<std::size_t> tail_lines = std::nullopt,
                                            std::optional<LogClock::time_point> since = std::nullopt) const;

private:
    struct Session;
    std::shared_ptr<Session> find(const std::string& session_id) const;
    StopResult stop(Session& session);

    std::size_t m_max_log_lines;
    std::chrono::milliseconds m_stop_timeout;
    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, std::shared_ptr<Session>> m_sessions;
};

} // namespace cligate
