/*
 * Operation lock registry - CLI-Gateway
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cligate {

struct LockHolder {
    std::string operation_kind;
    std::string target;                               // normalized key
    std::chrono::system_clock::time_point acquired_at;
};

struct AcquireResult {
    bool granted = false;
    std::optional<LockHolder> holder; // set when denied
};

// At most one operation per normalized target, whatever its kind. Never
// blocks and never queues: a denied caller gets the current holder back.
class OperationLockRegistry {
public:
    OperationLockRegistry() = default;
    OperationLockRegistry(const OperationLockRegistry&) = delete;
    OperationLockRegistry& operator=(const OperationLockRegistry&) = delete;

    AcquireResult try_acquire(const std::string& operation_kind, const std::string& target);
    // No-op if nothing is held for the target.
    void release(const std::string& operation_kind, const std::string& target);
    void clear();

    std::size_t held_count() const;
    std::optional<LockHolder> holder(const std::string& target) const;
    std::vector<LockHolder> held() const;

private:
    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, LockHolder> m_locks;
};

// Releases a granted lock exactly once: on release() or on destruction.
class OperationLease {
public:
    OperationLease() = default;
    OperationLease(OperationLockRegistry& registry, std::string operation_kind, std::string target)
        : m_registry(&registry), m_kind(std::move(operation_kind)), m_target(std::move(target)) {}
    ~OperationLease() { release(); }
    OperationLease(const OperationLease&) = delete;
    OperationLease& operator=(const OperationLease&) = delete;
    OperationLease(OperationLease&& other) noexcept;
    OperationLease& operator=(OperationLease&& other) noexcept;

    void release();
    bool active() const { return m_registry != nullptr; }
    const std::string& target() const { return m_target; }

private:
    OperationLockRegistry* m_registry = nullptr;
    std::string m_kind;
    std::string m_target;
};

// "YYYY-MM-DD HH:MM:SS" in UTC.
std::string format_utc(std::chrono::system_clock::time_point tp);

// User-facing conflict message naming the holder and its start time.
std::string format_conflict(const std::string& operation_kind, const std::string& target,
                            const LockHolder& holder);

} // namespace cligate
