/*
 * Child process handle implementation - CLI-Gateway
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <cli-gateway/exec/process.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <unordered_map>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cligate {

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
    if (this != &other) {
        reset(other.m_fd);
        other.m_fd = -1;
    }
    return *this;
}

void FileDescriptor::reset(int fd) {
    if (m_fd >= 0) ::close(m_fd);
    m_fd = fd;
}

static std::system_error os_error(const char* what) {
    return std::system_error(errno, std::generic_category(), what);
}

// ppid is the 4th field of /proc/<pid>/stat, after the parenthesised comm.
static std::optional<pid_t> read_ppid(const std::string& pid_dir) {
    std::ifstream in(pid_dir + "/stat");
    std::string line;
    if (!std::getline(in, line)) return std::nullopt;
    auto rp = line.rfind(')');
    if (rp == std::string::npos || rp + 4 >= line.size()) return std::nullopt;
    char state = 0; long ppid = 0;
    if (std::sscanf(line.c_str() + rp + 1, " %c %ld", &state, &ppid) != 2) return std::nullopt;
    if (state == 'Z') return std::nullopt;
    return static_cast<pid_t>(ppid);
}

std::vector<pid_t> descendant_pids(pid_t root) {
    std::unordered_multimap<pid_t, pid_t> children;
    std::error_code ec;
    for (auto it = std::filesystem::directory_iterator("/proc", ec);
         !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        auto name = it->path().filename().string();
        if (name.empty() || name.find_first_not_of("0123456789") != std::string::npos) continue;
        if (auto ppid = read_ppid(it->path().string()))
            children.emplace(*ppid, static_cast<pid_t>(std::stol(name)));
    }
    if (ec) spdlog::debug("scanning /proc: {}", ec.message());
    std::vector<pid_t> out;
    std::vector<pid_t> frontier{root};
    while (!frontier.empty()) {
        pid_t parent = frontier.back(); frontier.pop_back();
        auto [b, e] = children.equal_range(parent);
        for (auto it = b; it != e; ++it) {
            out.push_back(it->second);
            frontier.push_back(it->second);
        }
    }
    return out;
}

std::unique_ptr<Process> Process::spawn(const ProcessSpec& spec) {
    if (spec.argv.empty() || spec.argv[0].empty())
        throw std::invalid_argument("process argv must not be empty");

    // CLOEXEC so children spawned concurrently from other threads do not
    // inherit our read ends and hold the pipes open.
    int out[2], err[2];
    if (pipe2(out, O_CLOEXEC) != 0) throw os_error("pipe2");
    if (pipe2(err, O_CLOEXEC) != 0) {
        int saved = errno; ::close(out[0]); ::close(out[1]); errno = saved;
        throw os_error("pipe2");
    }
    FileDescriptor out_r(out[0]), out_w(out[1]), err_r(err[0]), err_w(err[1]);

    // Build everything the child needs before fork: only async-signal-safe
    // calls are allowed between fork and exec in a threaded parent.
    std::vector<char*> cargv; cargv.reserve(spec.argv.size()+1);
    for (auto &s : spec.argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);
    std::vector<std::string> env_storage;
    std::vector<char*> cenv;
    if (!spec.environment.empty()) {
        std::map<std::string, std::string> merged;
        for (char** e = environ; e && *e; ++e) {
            std::string kv = *e;
            auto eq = kv.find('=');
            if (eq == std::string::npos) continue;
            merged[kv.substr(0, eq)] = kv.substr(eq+1);
        }
        for (auto &[k, v] : spec.environment) merged[k] = v;
        for (auto &[k, v] : merged) env_storage.push_back(k + "=" + v);
        for (auto &s : env_storage) cenv.push_back(s.data());
        cenv.push_back(nullptr);
    }
    std::string workdir = spec.working_directory ? spec.working_directory->string() : std::string();

    pid_t pid = fork();
    if (pid < 0) throw os_error("fork");
    if (pid == 0) {
        setpgid(0, 0);
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGPIPE, SIG_DFL);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) { dup2(devnull, STDIN_FILENO); ::close(devnull); }
        if (dup2(out_w.get(), STDOUT_FILENO) < 0) _exit(127);
        if (dup2(err_w.get(), STDERR_FILENO) < 0) _exit(127);
        if (!workdir.empty() && chdir(workdir.c_str()) != 0) _exit(127);
        if (!cenv.empty()) environ = cenv.data();
        execvp(cargv[0], cargv.data());
        _exit(127);
    }
    // Both sides call setpgid so the group exists whichever runs first.
    setpgid(pid, pid);

    auto p = std::make_unique<Process>(PrivateTag{});
    p->m_pid = pid;
    p->m_argv = spec.argv;
    p->m_stdout = std::move(out_r);
    p->m_stderr = std::move(err_r);
    spdlog::debug("spawned '{}' (pid={})", spec.argv[0], pid);
    return p;
}

Process::~Process() {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (m_pid <= 0 || m_reaped) return;
    if (!probe_locked()) return;
    // Still alive: do not leave an orphaned tree behind.
    if (!signal_tree_locked()) return;
    for (int i = 0; i < 100 && probe_locked(); ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    if (!m_reaped) spdlog::warn("pid {} not reaped after SIGKILL", m_pid);
}

bool Process::probe_locked() {
    if (m_reaped) return false;
    while (true) {
        int st = 0;
        pid_t r = waitpid(m_pid, &st, WNOHANG);
        if (r == 0) return true;
        if (r < 0) {
            if (errno == EINTR) continue;
            // ECHILD: reaped elsewhere, nothing left to observe.
            m_reaped = true;
            return false;
        }
        if (WIFEXITED(st)) m_exit_code = WEXITSTATUS(st);
        else if (WIFSIGNALED(st)) m_exit_code = 128 + WTERMSIG(st);
        else continue; // stop/continue notifications are not exits
        m_reaped = true;
        return false;
    }
}

bool Process::is_running() {
    std::lock_guard<std::mutex> lk(m_mutex);
    return probe_locked();
}

std::optional<int> Process::exit_code() {
    std::lock_guard<std::mutex> lk(m_mutex);
    probe_locked();
    return m_exit_code;
}

bool Process::wait_for_exit(std::chrono::milliseconds timeout, std::stop_token stop,
                            std::chrono::milliseconds poll) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (!is_running()) return true;
        if (stop.stop_requested()) return false;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(poll);
    }
}

bool Process::signal_tree_locked() {
    // Freeze first so nothing forks between the /proc scan and the kill.
    // Best effort: refusals surface through the SIGKILL pass below.
    (void)::kill(-m_pid, SIGSTOP);
    auto tree = descendant_pids(m_pid);
    for (pid_t d : tree) (void)::kill(d, SIGSTOP);
    for (pid_t d : descendant_pids(m_pid))
        if (std::find(tree.begin(), tree.end(), d) == tree.end()) tree.push_back(d);

    bool root_killed = ::kill(-m_pid, SIGKILL) == 0;
    int group_errno = errno;
    if (!root_killed) root_killed = ::kill(m_pid, SIGKILL) == 0 || errno == ESRCH;
    int root_errno = errno;
    for (pid_t d : tree) {
        if (::kill(d, SIGKILL) != 0 && errno != ESRCH)
            spdlog::warn("kill of descendant {} of pid {} refused: {}", d, m_pid, std::strerror(errno));
    }
    if (!root_killed) {
        spdlog::warn("kill of pid {} refused: {} (group: {})", m_pid, std::strerror(root_errno),
                     std::strerror(group_errno));
        return false;
    }
    if (!tree.empty()) spdlog::debug("killed pid {} and {} descendant(s)", m_pid, tree.size());
    return true;
}

bool Process::kill_tree() {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (!probe_locked()) return true;
    return signal_tree_locked();
}

} // namespace cligate
