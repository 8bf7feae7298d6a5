/*
 * Tool dispatcher - CLI-Gateway
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <cli-gateway/config/config.hpp>
#include <cli-gateway/exec/operation_lock.hpp>
#include <cli-gateway/exec/session.hpp>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace cligate {

struct CommandSpec {
    std::string operation_kind;   // build, run, publish, ...
    std::string target;           // path or resource id, normalized by the dispatcher
    std::vector<std::string> argv;
    std::optional<std::filesystem::path> working_directory;
};

struct CommandOutcome {
    enum class Status { Completed, Conflict, NotFound, SpawnFailed, Cancelled };
    Status status = Status::Completed;
    int exit_code = 0;
    std::vector<std::string> output;
    std::vector<std::string> errors;
    std::optional<LockHolder> holder; // Conflict only
    std::string message;              // diagnostics for anything but Completed
};

struct StartOutcome {
    enum class Status { Started, Conflict, NotFound, SpawnFailed, DuplicateSession };
    Status status = Status::Started;
    pid_t pid = -1;
    std::optional<LockHolder> holder;
    std::string message;
};

const char* to_string(CommandOutcome::Status s);
const char* to_string(StartOutcome::Status s);

// Ties the lock registry, process spawning and the session registry together.
// Both registries are injected so callers (and tests) control their lifetime.
class ToolDispatcher {
public:
    ToolDispatcher(OperationLockRegistry& locks, ProcessSessionRegistry& sessions, GatewayConfig cfg = {})
        : m_locks(locks), m_sessions(sessions), m_cfg(std::move(cfg)) {}
    ~ToolDispatcher();
    ToolDispatcher(const ToolDispatcher&) = delete;
    ToolDispatcher& operator=(const ToolDispatcher&) = delete;

    // Short-lived operation: holds the target lock until the process exits.
    // A stop request kills the process tree and returns Cancelled with the
    // output captured so far.
    CommandOutcome run(const CommandSpec& spec, std::stop_token stop = {});

    // Long-running operation: registers a session that keeps the target
    // lock until its process exits or it is stopped or removed.
    StartOutcome start_session(const std::string& session_id, const CommandSpec& spec);
    StopResult stop_session(const std::string& session_id);
    StopResult remove_session(const std::string& session_id);
    // Cleans up exited sessions and releases their locks. Returns sessions removed.
    int reap();
    // Releases the locks of sessions whose process has exited, keeping the
    // sessions themselves. Returns locks released.
    int release_finished_leases();
    // Stops every session, then clears both registries.
    void shutdown();

    OperationLockRegistry& locks() { return m_locks; }
    ProcessSessionRegistry& sessions() { return m_sessions; }

private:
    std::optional<OperationLease> acquire(const CommandSpec& spec, const std::string& target,
                                          std::optional<LockHolder>& holder, std::string& message);
    void release_session_lease(const std::string& session_id);

    OperationLockRegistry& m_locks;
    ProcessSessionRegistry& m_sessions;
    GatewayConfig m_cfg;
    struct SessionLease {
        OperationLease lease;
        bool registered = false; // false while start_session is still spawning
    };
    std::mutex m_lease_mutex;
    std::map<std::string, SessionLease> m_session_leases;
};

} // namespace cligate
