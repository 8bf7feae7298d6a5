/*
 * Session log buffer implementation - CLI-Gateway
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <cli-gateway/exec/log_buffer.hpp>
#include <algorithm>
#include <mutex>
#include <utility>

namespace cligate {

const char* to_string(LogStream s) {
    return s == LogStream::Stdout ? "stdout" : "stderr";
}

void LogBuffer::append(LogStream stream, std::string text) {
    std::unique_lock<std::shared_mutex> lk(m_mutex);
    auto &ch = channel(stream);
    // Clamp so a wall-clock step backwards never reorders a stream.
    auto now = std::max(LogClock::now(), ch.last);
    ch.last = now;
    ch.lines.push_back(LogLine{stream, std::move(text), now, m_next_seq++});
    ++ch.appended;
    if (m_max > 0) {
        while (ch.lines.size() > m_max) { ch.lines.pop_front(); ++ch.dropped; }
    }
}

std::vector<LogLine> LogBuffer::snapshot(LogStream stream) const {
    std::shared_lock<std::shared_mutex> lk(m_mutex);
    auto &ch = channel(stream);
    return {ch.lines.begin(), ch.lines.end()};
}

std::size_t LogBuffer::line_count(LogStream stream) const {
    std::shared_lock<std::shared_mutex> lk(m_mutex);
    return channel(stream).lines.size();
}

std::uint64_t LogBuffer::total_appended(LogStream stream) const {
    std::shared_lock<std::shared_mutex> lk(m_mutex);
    return channel(stream).appended;
}

std::uint64_t LogBuffer::dropped(LogStream stream) const {
    std::shared_lock<std::shared_mutex> lk(m_mutex);
    return channel(stream).dropped;
}

LogSelection LogBuffer::select(std::optional<LogClock::time_point> since,
                               std::optional<std::size_t> tail) const {
    LogSelection sel;
    {
        std::shared_lock<std::shared_mutex> lk(m_mutex);
        auto keep = [&](const LogLine& l) { return !since || l.timestamp >= *since; };
        for (auto &l : m_out.lines) if (keep(l)) sel.output.push_back(l);
        for (auto &l : m_err.lines) if (keep(l)) sel.errors.push_back(l);
    }
    if (!tail || sel.output.size() + sel.errors.size() <= *tail) return sel;

    // Walk both (already ordered) streams backwards, taking the newer line each step.
    auto newer = [](const LogLine& a, const LogLine& b) {
        if (a.timestamp != b.timestamp) return a.timestamp > b.timestamp;
        return a.sequence > b.sequence;
    };
    std::size_t out_take = 0, err_take = 0;
    std::size_t oi = sel.output.size(), ei = sel.errors.size();
    while (out_take + err_take < *tail && (oi > 0 || ei > 0)) {
        if (ei == 0 || (oi > 0 && newer(sel.output[oi-1], sel.errors[ei-1]))) { --oi; ++out_take; }
        else { --ei; ++err_take; }
    }
    sel.output.erase(sel.output.begin(), sel.output.end() - static_cast<std::ptrdiff_t>(out_take));
    sel.errors.erase(sel.errors.begin(), sel.errors.end() - static_cast<std::ptrdiff_t>(err_take));
    return sel;
}

} // namespace cligate
