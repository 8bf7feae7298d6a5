/*
 * Operation lock registry implementation - CLI-Gateway
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <cli-gateway/exec/operation_lock.hpp>
#include <cli-gateway/exec/target.hpp>
#include <spdlog/spdlog.h>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace cligate {

AcquireResult OperationLockRegistry::try_acquire(const std::string& operation_kind, const std::string& target) {
    auto key = normalize_target(target);
    std::unique_lock<std::shared_mutex> lk(m_mutex);
    auto [it, inserted] = m_locks.try_emplace(key, LockHolder{operation_kind, key, std::chrono::system_clock::now()});
    if (!inserted) {
        spdlog::info("lock denied: '{}' on '{}' held by '{}'", operation_kind, key, it->second.operation_kind);
        return AcquireResult{false, it->second};
    }
    spdlog::debug("lock acquired: '{}' on '{}'", operation_kind, key);
    return AcquireResult{true, std::nullopt};
}

void OperationLockRegistry::release(const std::string& operation_kind, const std::string& target) {
    auto key = normalize_target(target);
    std::unique_lock<std::shared_mutex> lk(m_mutex);
    if (m_locks.erase(key) > 0) spdlog::debug("lock released: '{}' on '{}'", operation_kind, key);
}

void OperationLockRegistry::clear() {
    std::unique_lock<std::shared_mutex> lk(m_mutex);
    m_locks.clear();
}

std::size_t OperationLockRegistry::held_count() const {
    std::shared_lock<std::shared_mutex> lk(m_mutex);
    return m_locks.size();
}

std::optional<LockHolder> OperationLockRegistry::holder(const std::string& target) const {
    auto key = normalize_target(target);
    std::shared_lock<std::shared_mutex> lk(m_mutex);
    auto it = m_locks.find(key);
    if (it == m_locks.end()) return std::nullopt;
    return it->second;
}

std::vector<LockHolder> OperationLockRegistry::held() const {
    std::shared_lock<std::shared_mutex> lk(m_mutex);
    std::vector<LockHolder> out;
    out.reserve(m_locks.size());
    for (auto &kv : m_locks) out.push_back(kv.second);
    return out;
}

OperationLease::OperationLease(OperationLease&& other) noexcept
    : m_registry(other.m_registry), m_kind(std::move(other.m_kind)), m_target(std::move(other.m_target)) {
    other.m_registry = nullptr;
}

OperationLease& OperationLease::operator=(OperationLease&& other) noexcept {
    if (this != &other) {
        release();
        m_registry = other.m_registry;
        m_kind = std::move(other.m_kind);
        m_target = std::move(other.m_target);
        other.m_registry = nullptr;
    }
    return *this;
}

void OperationLease::release() {
    if (!m_registry) return;
    m_registry->release(m_kind, m_target);
    m_registry = nullptr;
}

std::string format_utc(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::string format_conflict(const std::string& operation_kind, const std::string& target,
                            const LockHolder& holder) {
    return "Cannot execute '" + operation_kind + "' on '" + target +
           "' because a conflicting operation is already in progress: " + holder.operation_kind + " on " +
           holder.target + " (started at " + format_utc(holder.acquired_at) + ")";
}

} // namespace cligate
