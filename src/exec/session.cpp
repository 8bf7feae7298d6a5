/*
 * Process session registry implementation - CLI-Gateway
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <cli-gateway/exec/session.hpp>
#include <cli-gateway/exec/log_capture.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <mutex>
#include <stdexcept>

namespace cligate {

struct ProcessSessionRegistry::Session {
    std::string id;
    std::string operation_kind;
    std::string target;
    std::chrono::system_clock::time_point started_at;
    std::unique_ptr<Process> process;
    std::shared_ptr<LogBuffer> logs;
    std::unique_ptr<LogCapture> capture; // destroyed before the process
    std::atomic<bool> abandoned{false};  // kill refused, no longer tracked as running

    bool running() { return !abandoned && process->is_running(); }

    SessionInfo info() {
        return SessionInfo{id, process->pid(), operation_kind, target, started_at,
                           running(), process->exit_code()};
    }
};

static bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

ProcessSessionRegistry::ProcessSessionRegistry(std::size_t max_log_lines_per_stream,
                                               std::chrono::milliseconds stop_timeout)
    : m_max_log_lines(max_log_lines_per_stream), m_stop_timeout(stop_timeout) {}

ProcessSessionRegistry::~ProcessSessionRegistry() { clear(); }

bool ProcessSessionRegistry::register_session(const std::string& session_id, std::unique_ptr<Process>&& process,
                                              const std::string& operation_kind, const std::string& target) {
    if (is_blank(session_id)) throw std::invalid_argument("session id cannot be null or empty");
    if (!process) throw std::invalid_argument("process cannot be null");

    std::unique_lock<std::shared_mutex> lk(m_mutex);
    if (m_sessions.count(session_id)) {
        spdlog::warn("session '{}' already exists", session_id);
        return false;
    }
    auto s = std::make_shared<Session>();
    s->id = session_id;
    s->operation_kind = operation_kind;
    s->target = target;
    s->started_at = std::chrono::system_clock::now();
    s->process = std::move(process);
    s->logs = std::make_shared<LogBuffer>(m_max_log_lines);
    s->capture = LogCapture::start(*s->process, s->logs);
    spdlog::info("registered session '{}' for {} on '{}' (pid={})", session_id, operation_kind, target,
                 s->process->pid());
    m_sessions.emplace(session_id, std::move(s));
    return true;
}

std::shared_ptr<ProcessSessionRegistry::Session> ProcessSessionRegistry::find(const std::string& session_id) const {
    std::shared_lock<std::shared_mutex> lk(m_mutex);
    auto it = m_sessions.find(session_id);
    if (it == m_sessions.end()) return nullptr;
    return it->second;
}

StopResult ProcessSessionRegistry::stop(Session& s) {
    if (!s.running()) {
        spdlog::info("session '{}' already exited (exit code {})", s.id, s.process->exit_code().value_or(-1));
        return StopResult{true, true, {}};
    }
    spdlog::info("stopping session '{}' (pid={})", s.id, s.process->pid());
    if (!s.process->kill_tree()) {
        s.abandoned = true;
        spdlog::error("session '{}' (pid={}) refused termination, no longer tracked as running", s.id,
                      s.process->pid());
        return StopResult{false, true, "Failed to stop session '" + s.id + "': the process refused termination"};
    }
    if (!s.process->wait_for_exit(m_stop_timeout))
        spdlog::warn("session '{}' did not exit within {} ms", s.id, m_stop_timeout.count());
    return StopResult{true, true, {}};
}

static StopResult not_found(const std::string& session_id) {
    return StopResult{false, false,
                      "Session '" + session_id + "' not found. It may have already completed or been removed."};
}

StopResult ProcessSessionRegistry::try_stop_session(const std::string& session_id) {
    auto s = find(session_id);
    if (!s) {
        spdlog::warn("attempted to stop unknown session '{}'", session_id);
        return not_found(session_id);
    }
    return stop(*s);
}

StopResult ProcessSessionRegistry::try_remove_session(const std::string& session_id) {
    std::shared_ptr<Session> s;
    {
        std::unique_lock<std::shared_mutex> lk(m_mutex);
        auto it = m_sessions.find(session_id);
        if (it == m_sessions.end()) return not_found(session_id);
        s = std::move(it->second);
        m_sessions.erase(it);
    }
    // Removed from the map even if the kill is refused: callers must not be
    // left holding an unkillable entry.
    auto r = stop(*s);
    spdlog::info("removed session '{}'", session_id);
    return r;
}

std::optional<SessionInfo> ProcessSessionRegistry::try_get_session(const std::string& session_id) const {
    auto s = find(session_id);
    if (!s) return std::nullopt;
    return s->info();
}

std::vector<SessionInfo> ProcessSessionRegistry::active_sessions() const {
    std::vector<std::shared_ptr<Session>> snapshot;
    {
        std::shared_lock<std::shared_mutex> lk(m_mutex);
        snapshot.reserve(m_sessions.size());
        for (auto &kv : m_sessions) snapshot.push_back(kv.second);
    }
    std::vector<SessionInfo> out;
    out.reserve(snapshot.size());
    for (auto &s : snapshot) out.push_back(s->info());
    std::sort(out.begin(), out.end(), [](const SessionInfo& a, const SessionInfo& b) {
        if (a.started_at != b.started_at) return a.started_at < b.started_at;
        return a.session_id < b.session_id;
    });
    return out;
}

std::size_t ProcessSessionRegistry::active_session_count() const {
    std::shared_lock<std::shared_mutex> lk(m_mutex);
    return m_sessions.size();
}

int ProcessSessionRegistry::cleanup_completed_sessions() {
    std::vector<std::shared_ptr<Session>> removed;
    {
        std::unique_lock<std::shared_mutex> lk(m_mutex);
        for (auto it = m_sessions.begin(); it != m_sessions.end();) {
            if (!it->second->running()) {
                spdlog::debug("cleaned up completed session '{}'", it->first);
                removed.push_back(std::move(it->second));
                it = m_sessions.erase(it);
            } else {
                ++it;
            }
        }
    }
    // Capture threads are joined here, outside the map lock.
    return static_cast<int>(removed.size());
}

void ProcessSessionRegistry::clear() {
    std::unordered_map<std::string, std::shared_ptr<Session>> dropped;
    {
        std::unique_lock<std::shared_mutex> lk(m_mutex);
        dropped.swap(m_sessions);
    }
    if (!dropped.empty()) spdlog::debug("cleared {} session(s)", dropped.size());
}

std::optional<SessionLogs> ProcessSessionRegistry::session_logs(const std::string& session_id,
                                                                std::optional<std::size_t> tail_lines,
                                                                std::optional<LogClock::time_point> since) const {
    auto s = find(session_id);
    if (!s) return std::nullopt;
    SessionLogs logs;
    logs.session_id = s->id;
    logs.operation_kind = s->operation_kind;
    logs.target = s->target;
    logs.started_at = s->started_at;
    logs.running = s->running();
    logs.total_output_lines = s->logs->line_count(LogStream::Stdout);
    logs.total_error_lines = s->logs->line_count(LogStream::Stderr);
    auto sel = s->logs->select(since, tail_lines);
    logs.output_lines = std::move(sel.output);
    logs.error_lines = std::move(sel.errors);
    return logs;
}

} // namespace cligate
