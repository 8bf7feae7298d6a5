/*
 * Tool dispatcher implementation - CLI-Gateway
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <cli-gateway/exec/dispatcher.hpp>
#include <cli-gateway/exec/log_capture.hpp>
#include <cli-gateway/exec/path.hpp>
#include <cli-gateway/exec/target.hpp>
#include <spdlog/spdlog.h>
#include <system_error>

namespace cligate {

const char* to_string(CommandOutcome::Status s) {
    switch (s) {
        case CommandOutcome::Status::Completed: return "completed";
        case CommandOutcome::Status::Conflict: return "conflict";
        case CommandOutcome::Status::NotFound: return "not-found";
        case CommandOutcome::Status::SpawnFailed: return "spawn-failed";
        case CommandOutcome::Status::Cancelled: return "cancelled";
    }
    return "?";
}

const char* to_string(StartOutcome::Status s) {
    switch (s) {
        case StartOutcome::Status::Started: return "started";
        case StartOutcome::Status::Conflict: return "conflict";
        case StartOutcome::Status::NotFound: return "not-found";
        case StartOutcome::Status::SpawnFailed: return "spawn-failed";
        case StartOutcome::Status::DuplicateSession: return "duplicate-session";
    }
    return "?";
}

static std::vector<std::string> texts(const std::vector<LogLine>& lines) {
    std::vector<std::string> out;
    out.reserve(lines.size());
    for (auto &l : lines) out.push_back(l.text);
    return out;
}

ToolDispatcher::~ToolDispatcher() = default;

std::optional<OperationLease> ToolDispatcher::acquire(const CommandSpec& spec, const std::string& target,
                                                      std::optional<LockHolder>& holder, std::string& message) {
    auto r = m_locks.try_acquire(spec.operation_kind, target);
    // The holder may be a session that has since exited on its own.
    if (!r.granted && release_finished_leases() > 0) r = m_locks.try_acquire(spec.operation_kind, target);
    if (!r.granted) {
        holder = r.holder;
        message = format_conflict(spec.operation_kind, target, *r.holder);
        return std::nullopt;
    }
    return std::optional<OperationLease>(std::in_place, m_locks, spec.operation_kind, target);
}

CommandOutcome ToolDispatcher::run(const CommandSpec& spec, std::stop_token stop) {
    CommandOutcome res;
    auto target = normalize_target(spec.target);
    auto lease = acquire(spec, target, res.holder, res.message);
    if (!lease) { res.status = CommandOutcome::Status::Conflict; res.exit_code = -1; return res; }

    std::optional<std::string> exe;
    if (!spec.argv.empty()) exe = resolve_executable(spec.argv[0]);
    if (!exe) {
        res.status = CommandOutcome::Status::NotFound; res.exit_code = 127;
        res.message = (spec.argv.empty() ? std::string("(empty)") : spec.argv[0]) + ": command not found";
        return res;
    }
    ProcessSpec ps{spec.argv, spec.working_directory, {}};
    ps.argv[0] = *exe;
    std::unique_ptr<Process> proc;
    try {
        proc = Process::spawn(ps);
    } catch (const std::system_error& e) {
        spdlog::error("failed to start '{}': {}", spec.argv[0], e.what());
        res.status = CommandOutcome::Status::SpawnFailed; res.exit_code = -1; res.message = e.what();
        return res;
    }
    auto buffer = std::make_shared<LogBuffer>(m_cfg.max_log_lines);
    auto capture = LogCapture::start(*proc, buffer);

    bool exited = false;
    while (!(exited = proc->wait_for_exit(std::chrono::hours(1), stop, m_cfg.poll_interval))) {
        if (stop.stop_requested()) break;
    }
    if (!exited) {
        spdlog::warn("cancellation requested - terminating '{}' (pid={})", spec.argv[0], proc->pid());
        if (!proc->kill_tree())
            spdlog::error("could not terminate pid {} after cancellation", proc->pid());
        else if (!proc->wait_for_exit(m_cfg.stop_timeout))
            spdlog::warn("pid {} did not exit within {} ms", proc->pid(), m_cfg.stop_timeout.count());
        res.status = CommandOutcome::Status::Cancelled;
        res.message = "The operation was cancelled";
    }
    // Drain what is left in the pipes; a detached grandchild may keep them open.
    if (!capture->wait_finished(m_cfg.stop_timeout))
        spdlog::debug("output of pid {} still open after exit, stopping capture", proc->pid());
    capture->stop();
    res.exit_code = proc->exit_code().value_or(-1);
    res.output = texts(buffer->snapshot(LogStream::Stdout));
    res.errors = texts(buffer->snapshot(LogStream::Stderr));
    return res;
}

StartOutcome ToolDispatcher::start_session(const std::string& session_id, const CommandSpec& spec) {
    StartOutcome res;
    if (m_sessions.try_get_session(session_id)) {
        res.status = StartOutcome::Status::DuplicateSession;
        res.message = "Session '" + session_id + "' already exists";
        return res;
    }
    auto target = normalize_target(spec.target);
    auto lease = acquire(spec, target, res.holder, res.message);
    if (!lease) { res.status = StartOutcome::Status::Conflict; return res; }

    std::optional<std::string> exe;
    if (!spec.argv.empty()) exe = resolve_executable(spec.argv[0]);
    if (!exe) {
        res.status = StartOutcome::Status::NotFound;
        res.message = (spec.argv.empty() ? std::string("(empty)") : spec.argv[0]) + ": command not found";
        return res;
    }
    ProcessSpec ps{spec.argv, spec.working_directory, {}};
    ps.argv[0] = *exe;
    std::unique_ptr<Process> proc;
    try {
        proc = Process::spawn(ps);
    } catch (const std::system_error& e) {
        spdlog::error("failed to start '{}': {}", spec.argv[0], e.what());
        res.status = StartOutcome::Status::SpawnFailed; res.message = e.what();
        return res;
    }
    res.pid = proc->pid();
    {
        // Parked before registration so a concurrent stop or remove always
        // finds the lease to release.
        std::lock_guard<std::mutex> lk(m_lease_mutex);
        if (!m_session_leases.try_emplace(session_id, SessionLease{std::move(*lease), false}).second) {
            if (!proc->kill_tree()) spdlog::error("could not terminate orphaned pid {}", res.pid);
            res.status = StartOutcome::Status::DuplicateSession;
            res.message = "Session '" + session_id + "' already exists";
            return res;
        }
    }
    if (!m_sessions.register_session(session_id, std::move(proc), spec.operation_kind, target)) {
        // Lost a race on the id: the process is still ours to dispose of.
        if (!proc->kill_tree()) spdlog::error("could not terminate orphaned pid {}", res.pid);
        release_session_lease(session_id);
        res.status = StartOutcome::Status::DuplicateSession;
        res.message = "Session '" + session_id + "' already exists";
        return res;
    }
    std::lock_guard<std::mutex> lk(m_lease_mutex);
    auto it = m_session_leases.find(session_id);
    if (it != m_session_leases.end()) it->second.registered = true;
    return res;
}

void ToolDispatcher::release_session_lease(const std::string& session_id) {
    std::lock_guard<std::mutex> lk(m_lease_mutex);
    m_session_leases.erase(session_id);
}

StopResult ToolDispatcher::stop_session(const std::string& session_id) {
    auto r = m_sessions.try_stop_session(session_id);
    // A refused kill still leaves the session out of the running view.
    if (r.found) release_session_lease(session_id);
    return r;
}

StopResult ToolDispatcher::remove_session(const std::string& session_id) {
    auto r = m_sessions.try_remove_session(session_id);
    if (r.found) release_session_lease(session_id);
    return r;
}

int ToolDispatcher::release_finished_leases() {
    int released = 0;
    std::lock_guard<std::mutex> lk(m_lease_mutex);
    for (auto it = m_session_leases.begin(); it != m_session_leases.end();) {
        if (!it->second.registered) { ++it; continue; }
        auto info = m_sessions.try_get_session(it->first);
        if (!info || !info->running) {
            spdlog::debug("session '{}' finished, releasing '{}'", it->first, it->second.lease.target());
            it = m_session_leases.erase(it);
            ++released;
        } else {
            ++it;
        }
    }
    return released;
}

int ToolDispatcher::reap() {
    int removed = m_sessions.cleanup_completed_sessions();
    release_finished_leases();
    return removed;
}

void ToolDispatcher::shutdown() {
    for (auto &s : m_sessions.active_sessions()) {
        if (!s.running) continue;
        auto r = m_sessions.try_stop_session(s.session_id);
        if (!r.stopped) spdlog::warn("shutdown: {}", r.error);
    }
    m_sessions.clear();
    {
        std::lock_guard<std::mutex> lk(m_lease_mutex);
        m_session_leases.clear();
    }
    m_locks.clear();
}

} // namespace cligate
