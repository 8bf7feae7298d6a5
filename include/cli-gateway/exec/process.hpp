/*
 * Child process handle - CLI-Gateway
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>
#include <sys/types.h>

namespace cligate {

// Pids of every live descendant of `root`, parents before children.
std::vector<pid_t> descendant_pids(pid_t root);

// Move-only owner of a file descriptor.
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : m_fd(fd) {}
    ~FileDescriptor() { reset(); }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&& other) noexcept : m_fd(other.m_fd) { other.m_fd = -1; }
    FileDescriptor& operator=(FileDescriptor&& other) noexcept;

    int get() const { return m_fd; }
    bool valid() const { return m_fd >= 0; }
    void reset(int fd = -1);
private:
    int m_fd = -1;
};

struct ProcessSpec {
    std::vector<std::string> argv;                     // argv[0] is the executable
    std::optional<std::filesystem::path> working_directory;
    std::map<std::string, std::string> environment;    // overrides on top of the inherited env
};

// A spawned child running in its own process group. kill_tree() signals the
// group and every descendant found under /proc, including those that moved
// to another group or session.
class Process {
    struct PrivateTag { explicit PrivateTag() = default; };
public:
    explicit Process(PrivateTag) {}
    ~Process();
    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    static std::unique_ptr<Process> spawn(const ProcessSpec& spec);

    pid_t pid() const { return m_pid; }
    const std::vector<std::string>& argv() const { return m_argv; }

    // Non-blocking probe; reaps the child on first observation of its exit.
    bool is_running();
    // Exit status once reaped: WEXITSTATUS, or 128+signal.
    std::optional<int> exit_code();

    // Polls until exit, timeout, or stop request. Returns true if exited.
    bool wait_for_exit(std::chrono::milliseconds timeout, std::stop_token stop = {},
                       std::chrono::milliseconds poll = std::chrono::milliseconds(20));

    // SIGKILL to the process group and to each live descendant. Returns
    // false only if the OS refused the signal for the child itself.
    bool kill_tree();

    FileDescriptor take_stdout() { return std::move(m_stdout); }
    FileDescriptor take_stderr() { return std::move(m_stderr); }

private:
    bool probe_locked();
    bool signal_tree_locked();

    pid_t m_pid = -1;
    std::vector<std::string> m_argv;
    FileDescriptor m_stdout;
    FileDescriptor m_stderr;
    std::mutex m_mutex;                // guards waitpid and the cached status
    bool m_reaped = false;
    std::optional<int> m_exit_code;
};

} // namespace cligate
