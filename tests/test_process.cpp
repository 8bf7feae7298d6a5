#include <gtest/gtest.h>
#include <cli-gateway/exec/log_capture.hpp>
#include <cli-gateway/exec/path.hpp>
#include <cli-gateway/exec/process.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <thread>
#include <signal.h>
#include <unistd.h>

using namespace cligate;
using namespace std::chrono_literals;

static std::unique_ptr<Process> sh(const std::string& script, ProcessSpec extra = {}) {
    extra.argv = {"/bin/sh", "-c", script};
    return Process::spawn(extra);
}

static std::vector<std::string> run_capture(std::unique_ptr<Process>& p) {
    auto buf = std::make_shared<LogBuffer>();
    auto cap = LogCapture::start(*p, buf);
    EXPECT_TRUE(cap->wait_finished(5s));
    EXPECT_TRUE(p->wait_for_exit(5s));
    std::vector<std::string> out;
    for (auto &l : buf->snapshot(LogStream::Stdout)) out.push_back(l.text);
    return out;
}

TEST(Process, EmptyArgvThrows) {
    EXPECT_THROW(Process::spawn(ProcessSpec{}), std::invalid_argument);
}

TEST(Process, ExitCodeIsReported) {
    auto p = sh("exit 3");
    ASSERT_TRUE(p->wait_for_exit(5s));
    EXPECT_FALSE(p->is_running());
    EXPECT_EQ(p->exit_code(), 3);
}

TEST(Process, RunningHasNoExitCode) {
    auto p = sh("sleep 30");
    EXPECT_TRUE(p->is_running());
    EXPECT_FALSE(p->exit_code().has_value());
    EXPECT_FALSE(p->wait_for_exit(50ms));
    EXPECT_TRUE(p->kill_tree());
    ASSERT_TRUE(p->wait_for_exit(5s));
    EXPECT_EQ(p->exit_code(), 128 + 9);
}

TEST(Process, MissingExecutableExits127) {
    auto p = Process::spawn(ProcessSpec{{"/nonexistent/definitely-not-here"}, std::nullopt, {}});
    ASSERT_TRUE(p->wait_for_exit(5s));
    EXPECT_EQ(p->exit_code(), 127);
}

TEST(Process, StopTokenInterruptsWait) {
    auto p = sh("sleep 30");
    std::stop_source src;
    src.request_stop();
    auto t0 = std::chrono::steady_clock::now();
    EXPECT_FALSE(p->wait_for_exit(10s, src.get_token()));
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 1s);
    EXPECT_TRUE(p->kill_tree());
}

TEST(Process, KillTreeOnExitedProcessSucceeds) {
    auto p = sh("true");
    ASSERT_TRUE(p->wait_for_exit(5s));
    EXPECT_TRUE(p->kill_tree());
}

TEST(Process, WorkingDirectoryIsApplied) {
    auto dir = std::filesystem::temp_directory_path();
    ProcessSpec spec; spec.working_directory = dir;
    auto p = sh("pwd", spec);
    auto out = run_capture(p);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(std::filesystem::canonical(out[0]), std::filesystem::canonical(dir));
}

TEST(Process, EnvironmentOverridesInherited) {
    ::setenv("CLI_GATEWAY_INHERITED", "kept", 1);
    ProcessSpec spec; spec.environment["CLI_GATEWAY_TEST_VAR"] = "hello";
    auto p = sh("echo $CLI_GATEWAY_TEST_VAR $CLI_GATEWAY_INHERITED", spec);
    auto out = run_capture(p);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], "hello kept");
    ::unsetenv("CLI_GATEWAY_INHERITED");
}

TEST(Process, StdinIsClosed) {
    auto p = sh("cat; echo done");
    auto out = run_capture(p);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], "done");
}

static bool gone_or_zombie(pid_t pid) {
    if (::kill(pid, 0) != 0) return true;
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string line;
    if (!std::getline(stat, line)) return true;
    auto rp = line.rfind(')');
    return rp != std::string::npos && rp + 2 < line.size() && line[rp + 2] == 'Z';
}

TEST(Process, DescendantsIncludeGrandchildren) {
    auto p = sh("sh -c 'sleep 30; true' & wait");
    std::vector<pid_t> tree;
    for (int i = 0; i < 250 && tree.size() < 2; ++i) {
        std::this_thread::sleep_for(20ms);
        tree = descendant_pids(p->pid());
    }
    EXPECT_GE(tree.size(), 2u);
    EXPECT_TRUE(p->kill_tree());
    ASSERT_TRUE(p->wait_for_exit(5s));
}

TEST(Process, KillTreeReachesDetachedDescendants) {
    auto p = sh("setsid sleep 30 & wait");
    pid_t detached = -1;
    for (int i = 0; i < 250 && detached < 0; ++i) {
        std::this_thread::sleep_for(20ms);
        for (pid_t d : descendant_pids(p->pid()))
            if (::getsid(d) == d) detached = d;
    }
    ASSERT_GT(detached, 0);
    EXPECT_TRUE(p->kill_tree());
    ASSERT_TRUE(p->wait_for_exit(5s));
    bool dead = false;
    for (int i = 0; i < 250 && !dead; ++i) {
        dead = gone_or_zombie(detached);
        if (!dead) std::this_thread::sleep_for(20ms);
    }
    EXPECT_TRUE(dead);
}

TEST(ResolveExecutable, FindsOnPath) {
    auto sh_path = resolve_executable("sh");
    ASSERT_TRUE(sh_path.has_value());
    EXPECT_EQ(std::filesystem::path(*sh_path).filename(), "sh");
}

TEST(ResolveExecutable, AbsolutePathCheckedInPlace) {
    EXPECT_EQ(resolve_executable("/bin/sh"), std::optional<std::string>("/bin/sh"));
    EXPECT_FALSE(resolve_executable("/bin/definitely-not-a-command").has_value());
}

TEST(ResolveExecutable, UnknownNameNotFound) {
    EXPECT_FALSE(resolve_executable("cli-gateway-no-such-command").has_value());
    EXPECT_FALSE(resolve_executable("").has_value());
}
