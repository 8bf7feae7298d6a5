/*
 * Stream capture pipeline implementation - CLI-Gateway
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <cli-gateway/exec/log_capture.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <string>
#include <poll.h>
#include <unistd.h>

namespace cligate {

// Upper bound on how long a reader waits before re-checking its stop token.
static constexpr int kPollTimeoutMs = 100;

std::unique_ptr<LogCapture> LogCapture::start(Process& process, std::shared_ptr<LogBuffer> buffer) {
    auto cap = std::make_unique<LogCapture>(PrivateTag{}, std::move(buffer));
    FileDescriptor out = process.take_stdout();
    FileDescriptor err = process.take_stderr();
    cap->m_open_readers = (out.valid() ? 1 : 0) + (err.valid() ? 1 : 0);
    if (out.valid())
        cap->m_stdout_reader = std::jthread([c = cap.get(), fd = std::move(out)](std::stop_token st) mutable {
            c->read_loop(st, std::move(fd), LogStream::Stdout);
        });
    if (err.valid())
        cap->m_stderr_reader = std::jthread([c = cap.get(), fd = std::move(err)](std::stop_token st) mutable {
            c->read_loop(st, std::move(fd), LogStream::Stderr);
        });
    return cap;
}

void LogCapture::read_loop(std::stop_token stop, FileDescriptor fd, LogStream stream) {
    std::string pending;
    char buf[4096];
    auto emit = [&](std::string line) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        m_buffer->append(stream, std::move(line));
    };
    while (!stop.stop_requested()) {
        pollfd pfd{fd.get(), POLLIN, 0};
        int pr = ::poll(&pfd, 1, kPollTimeoutMs);
        if (pr == 0) continue;
        if (pr < 0) {
            if (errno == EINTR) continue;
            spdlog::warn("{} capture: poll failed: {}", to_string(stream), std::strerror(errno));
            break;
        }
        ssize_t n = ::read(fd.get(), buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            spdlog::warn("{} capture: read failed: {}", to_string(stream), std::strerror(errno));
            break;
        }
        if (n == 0) break; // end of stream
        pending.append(buf, static_cast<size_t>(n));
        size_t start = 0, nl;
        while ((nl = pending.find('\n', start)) != std::string::npos) {
            emit(pending.substr(start, nl - start));
            start = nl + 1;
        }
        pending.erase(0, start);
    }
    if (!pending.empty()) emit(std::move(pending));
    spdlog::debug("{} capture finished", to_string(stream));
    reader_done();
}

void LogCapture::reader_done() {
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        --m_open_readers;
    }
    m_cv.notify_all();
}

void LogCapture::stop() {
    // jthread: request_stop() then join(); readers exit within one poll period.
    if (m_stdout_reader.joinable()) { m_stdout_reader.request_stop(); m_stdout_reader.join(); }
    if (m_stderr_reader.joinable()) { m_stderr_reader.request_stop(); m_stderr_reader.join(); }
}

bool LogCapture::finished() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_open_readers == 0;
}

bool LogCapture::wait_finished(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(m_mutex);
    return m_cv.wait_for(lk, timeout, [&] { return m_open_readers == 0; });
}

} // namespace cligate
