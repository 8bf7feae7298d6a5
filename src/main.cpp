// CLI-Gateway admin console: drives the lock and session registries from a
// line-oriented command stream (stdin or a script file).
#include <cli-gateway/config/config.hpp>
#include <cli-gateway/config/logging.hpp>
#include <cli-gateway/exec/dispatcher.hpp>
#include <cli-gateway/exec/operation_lock.hpp>
#include <cli-gateway/exec/session.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace cligate;

static volatile sig_atomic_t g_interrupted = 0;
static bool g_color = true;

static void sigint_handler(int) { g_interrupted = 1; }

static std::string apply_color(const std::string& s, const char* code) {
    if (!g_color) return s;
    return std::string("\x1b[") + code + "m" + s + "\x1b[0m";
}

// Whitespace split honouring double quotes and backslash escapes inside them.
static std::vector<std::string> split_words(const std::string& line) {
    std::vector<std::string> out; std::string cur; bool in_q = false, have = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_q) {
            if (c == '\\' && i+1 < line.size()) { cur.push_back(line[++i]); continue; }
            if (c == '"') { in_q = false; continue; }
            cur.push_back(c); continue;
        }
        if (c == '"') { in_q = true; have = true; continue; }
        if (std::isspace((unsigned char)c)) {
            if (have) { out.push_back(cur); cur.clear(); have = false; }
            continue;
        }
        cur.push_back(c); have = true;
    }
    if (have) out.push_back(cur);
    return out;
}

static void print_help() {
    std::cout <<
        "Commands:\n"
        "  run <kind> <target> -- <cmd> [args...]          run and wait (Ctrl-C cancels)\n"
        "  start <id> <kind> <target> -- <cmd> [args...]   start a background session\n"
        "  stop <id> | remove <id>                         kill a session's process tree\n"
        "  logs <id> [--tail N] [--since <epoch-ms>]       show captured output\n"
        "  sessions | locks | cleanup | help | exit\n";
}

static std::optional<CommandSpec> parse_spec(const std::vector<std::string>& w, size_t first, std::string& err) {
    auto dash = std::find(w.begin() + static_cast<std::ptrdiff_t>(first), w.end(), std::string("--"));
    size_t pos = static_cast<size_t>(dash - w.begin());
    if (dash == w.end() || pos != first + 2 || pos + 1 >= w.size()) {
        err = "expected: <kind> <target> -- <cmd> [args...]";
        return std::nullopt;
    }
    CommandSpec spec;
    spec.operation_kind = w[first];
    spec.target = w[first+1];
    spec.argv.assign(w.begin() + static_cast<std::ptrdiff_t>(pos + 1), w.end());
    return spec;
}

static long long epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

static int do_run(ToolDispatcher& disp, const std::vector<std::string>& w) {
    std::string err;
    auto spec = parse_spec(w, 1, err);
    if (!spec) { std::cerr << "run: " << err << '\n'; return 2; }
    std::atomic<bool> done{false};
    CommandOutcome outcome;
    g_interrupted = 0;
    std::jthread runner([&](std::stop_token st) { outcome = disp.run(*spec, st); done = true; });
    while (!done) {
        if (g_interrupted) { runner.request_stop(); g_interrupted = 0; }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    runner.join();
    for (auto &l : outcome.output) std::cout << l << '\n';
    for (auto &l : outcome.errors) std::cerr << apply_color(l, "31") << '\n';
    if (outcome.status != CommandOutcome::Status::Completed)
        std::cerr << apply_color(std::string("[") + to_string(outcome.status) + "] ", "33") << outcome.message << '\n';
    std::cout << "exit code " << outcome.exit_code << '\n';
    return outcome.exit_code;
}

static int do_start(ToolDispatcher& disp, const std::vector<std::string>& w) {
    if (w.size() < 2) { std::cerr << "start: missing session id\n"; return 2; }
    std::string err;
    auto spec = parse_spec(w, 2, err);
    if (!spec) { std::cerr << "start: " << err << '\n'; return 2; }
    auto r = disp.start_session(w[1], *spec);
    if (r.status != StartOutcome::Status::Started) {
        std::cerr << apply_color(std::string("[") + to_string(r.status) + "] ", "33") << r.message << '\n';
        return 1;
    }
    std::cout << "[" << r.pid << "] session " << w[1] << " running in background\n";
    return 0;
}

static int do_logs(ProcessSessionRegistry& sessions, const std::vector<std::string>& w) {
    if (w.size() < 2) { std::cerr << "logs: missing session id\n"; return 2; }
    std::optional<std::size_t> tail;
    std::optional<LogClock::time_point> since;
    for (size_t i = 2; i < w.size(); ++i) {
        try {
            if (w[i] == "--tail" && i+1 < w.size()) tail = static_cast<std::size_t>(std::stoul(w[++i]));
            else if (w[i] == "--since" && i+1 < w.size()) since = LogClock::time_point(std::chrono::milliseconds(std::stoll(w[++i])));
            else { std::cerr << "logs: unexpected argument '" << w[i] << "'\n"; return 2; }
        } catch (const std::exception& e) {
            std::cerr << "logs: invalid number for " << w[i-1] << " (" << e.what() << ")\n";
            return 2;
        }
    }
    auto logs = sessions.session_logs(w[1], tail, since);
    if (!logs) { std::cerr << "logs: session '" << w[1] << "' not found\n"; return 1; }
    std::cout << logs->session_id << " (" << logs->operation_kind << " on " << logs->target << ") "
              << (logs->running ? apply_color("running", "32") : apply_color("exited", "90")) << '\n';
    // Interleave both streams back into arrival order for display.
    std::vector<const LogLine*> all;
    for (auto &l : logs->output_lines) all.push_back(&l);
    for (auto &l : logs->error_lines) all.push_back(&l);
    std::sort(all.begin(), all.end(), [](const LogLine* a, const LogLine* b) { return a->sequence < b->sequence; });
    for (auto *l : all) {
        std::string ts = std::to_string(epoch_ms(l->timestamp));
        if (l->stream == LogStream::Stderr) std::cout << ts << " " << apply_color(l->text, "31") << '\n';
        else std::cout << ts << " " << l->text << '\n';
    }
    std::cout << "(" << logs->output_lines.size() << "/" << logs->total_output_lines << " stdout, "
              << logs->error_lines.size() << "/" << logs->total_error_lines << " stderr)\n";
    return 0;
}

static int do_sessions(ProcessSessionRegistry& sessions) {
    auto all = sessions.active_sessions();
    if (all.empty()) { std::cout << "no sessions\n"; return 0; }
    for (auto &s : all) {
        std::cout << s.session_id << "\tpid " << s.pid << "\t" << s.operation_kind << "\t" << s.target << "\t"
                  << format_utc(s.started_at) << "\t";
        if (s.running) std::cout << apply_color("running", "32");
        else std::cout << apply_color("exited " + std::to_string(s.exit_code.value_or(-1)), "90");
        std::cout << '\n';
    }
    return 0;
}

static int do_locks(ToolDispatcher& disp) {
    disp.release_finished_leases();
    auto held = disp.locks().held();
    if (held.empty()) { std::cout << "no locks held\n"; return 0; }
    for (auto &h : held)
        std::cout << h.target << "\t" << h.operation_kind << "\tsince " << format_utc(h.acquired_at) << '\n';
    return 0;
}

// Returns false when the console should exit.
static bool execute_line(ToolDispatcher& disp, const std::string& line, int& last_status) {
    auto w = split_words(line);
    if (w.empty()) return true;
    const auto& cmd = w[0];
    if (cmd == "exit" || cmd == "quit") return false;
    if (cmd == "help") { print_help(); last_status = 0; }
    else if (cmd == "run") last_status = do_run(disp, w);
    else if (cmd == "start") last_status = do_start(disp, w);
    else if (cmd == "stop" || cmd == "remove") {
        if (w.size() < 2) { std::cerr << cmd << ": missing session id\n"; last_status = 2; return true; }
        auto r = cmd == "stop" ? disp.stop_session(w[1]) : disp.remove_session(w[1]);
        if (r.stopped) { std::cout << "session " << w[1] << " stopped\n"; last_status = 0; }
        else { std::cerr << r.error << '\n'; last_status = 1; }
    }
    else if (cmd == "logs") last_status = do_logs(disp.sessions(), w);
    else if (cmd == "sessions") last_status = do_sessions(disp.sessions());
    else if (cmd == "locks") last_status = do_locks(disp);
    else if (cmd == "cleanup") { std::cout << disp.reap() << " session(s) cleaned up\n"; last_status = 0; }
    else { std::cerr << cmd << ": unknown command (try 'help')\n"; last_status = 2; }
    return true;
}

int main(int argc, char* argv[]) {
    std::string config_path = default_config_path();
    std::optional<std::string> level_override;
    bool no_color = false;
    std::string script;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config" && i+1 < argc) config_path = argv[++i];
        else if (a == "--log-level" && i+1 < argc) level_override = argv[++i];
        else if (a == "--no-color") no_color = true;
        else if (a == "-h" || a == "--help") {
            std::cout << "Usage: cli-gateway [--config <file>] [--log-level <level>] [--no-color] [script.gw]\n";
            return 0;
        }
        else script = a;
    }
    GatewayConfig cfg = load_config(config_path);
    if (level_override) cfg.log_level = *level_override;
    if (no_color) cfg.color = false;
    g_color = cfg.color && isatty(STDOUT_FILENO);
    init_logging(cfg.log_level, cfg.color);

    std::signal(SIGINT, sigint_handler);
    std::signal(SIGPIPE, SIG_IGN);

    OperationLockRegistry locks;
    ProcessSessionRegistry sessions(cfg.max_log_lines, cfg.stop_timeout);
    ToolDispatcher disp(locks, sessions, cfg);

    std::ifstream file;
    if (!script.empty()) {
        file.open(script);
        if (!file) { std::perror(("open " + script).c_str()); return 1; }
    }
    std::istream& in = script.empty() ? std::cin : file;
    bool interactive = script.empty() && isatty(STDIN_FILENO);
    if (interactive) {
        std::cout << apply_color("CLI-Gateway", "1;36") << " console. Type 'help' for commands.\n";
    }

    int last_status = 0;
    std::string line; size_t lineno = 0;
    while (true) {
        if (interactive) std::cout << apply_color("gw> ", "36") << std::flush;
        if (!std::getline(in, line)) break;
        ++lineno;
        auto notspace = [](int ch) { return !std::isspace(ch); };
        line.erase(line.begin(), std::find_if(line.begin(), line.end(), notspace));
        line.erase(std::find_if(line.rbegin(), line.rend(), notspace).base(), line.end());
        if (line.empty() || line[0] == '#') continue;
        if (!execute_line(disp, line, last_status)) break;
        if (!script.empty() && last_status != 0)
            std::cerr << "Line " << lineno << " exit status " << last_status << std::endl;
    }

    disp.shutdown();
    return last_status;
}
