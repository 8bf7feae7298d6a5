/*
 * Stream capture pipeline - CLI-Gateway
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <cli-gateway/exec/log_buffer.hpp>
#include <cli-gateway/exec/process.hpp>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace cligate {

// Drains a process's stdout and stderr into a LogBuffer, one reader thread
// per stream. Readers stop on end-of-stream or on stop(); lines already
// appended are never discarded.
class LogCapture {
    struct PrivateTag { explicit PrivateTag() = default; };
public:
    LogCapture(PrivateTag, std::shared_ptr<LogBuffer> buffer) : m_buffer(std::move(buffer)) {}

    // Takes ownership of the process's pipe read ends.
    static std::unique_ptr<LogCapture> start(Process& process, std::shared_ptr<LogBuffer> buffer);

    ~LogCapture() { stop(); }
    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    void stop();
    bool finished() const;
    bool wait_finished(std::chrono::milliseconds timeout);

    const std::shared_ptr<LogBuffer>& buffer() const { return m_buffer; }

private:
    void read_loop(std::stop_token stop, FileDescriptor fd, LogStream stream);
    void reader_done();

    std::shared_ptr<LogBuffer> m_buffer;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    int m_open_readers = 0;
    // Declared last: joined before the members above are destroyed.
    std::jthread m_stdout_reader;
    std::jthread m_stderr_reader;
};

} // namespace cligate
