/*
 * Session log buffer - CLI-Gateway
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace cligate {

using LogClock = std::chrono::system_clock;

enum class LogStream { Stdout, Stderr };

const char* to_string(LogStream s);

struct LogLine {
    LogStream stream;
    std::string text;               // newline-stripped
    LogClock::time_point timestamp; // non-decreasing within a stream
    std::uint64_t sequence;         // buffer-wide arrival order, breaks timestamp ties
};

struct LogSelection {
    std::vector<LogLine> output;
    std::vector<LogLine> errors;
};

// Append-only per-stream line store shared between the capture readers and
// any number of query callers. A max_lines_per_stream of 0 keeps everything.
class LogBuffer {
public:
    explicit LogBuffer(std::size_t max_lines_per_stream = 0) : m_max(max_lines_per_stream) {}

    void append(LogStream stream, std::string text);

    std::vector<LogLine> snapshot(LogStream stream) const;
    std::size_t line_count(LogStream stream) const;
    std::uint64_t total_appended(LogStream stream) const;
    std::uint64_t dropped(LogStream stream) const;

    // Lines with timestamp >= since (per stream), then at most `tail` lines
    // across both streams, most recent by (timestamp, sequence).
    LogSelection select(std::optional<LogClock::time_point> since,
                        std::optional<std::size_t> tail) const;

private:
    struct Channel {
        std::deque<LogLine> lines;
        LogClock::time_point last{};
        std::uint64_t appended = 0;
        std::uint64_t dropped = 0;
    };
    Channel& channel(LogStream s) { return s == LogStream::Stdout ? m_out : m_err; }
    const Channel& channel(LogStream s) const { return s == LogStream::Stdout ? m_out : m_err; }

    std::size_t m_max;
    mutable std::shared_mutex m_mutex;
    Channel m_out;
    Channel m_err;
    std::uint64_t m_next_seq = 0;
};

} // namespace cligate
