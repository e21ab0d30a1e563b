#include <gtest/gtest.h>

#include "child_process.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

#include <csignal>
#include <memory>
#include <type_traits>
#include <unistd.h>

using namespace mcphub;
using namespace std::chrono_literals;
using mcphub::testing::TempDir;
using mcphub::testing::wait_until;

namespace {

std::string read_all(int fd) {
    std::string out;
    char buf[1024];
    ssize_t n;
    while ((n = ::read(fd, buf, sizeof(buf))) > 0) out.append(buf, static_cast<size_t>(n));
    ::close(fd);
    return out;
}

} // namespace

TEST(ChildProcess, PipesStdoutAndAppliesEnvAndCwd)
{
    TempDir tmp;
    SpawnOptions opts;
    opts.command = "sh";
    opts.args = {"-c", "echo \"$GREETING\"; pwd"};
    opts.env = {{"GREETING", "hello from env"}};
    opts.cwd = tmp.path();

    auto proc = ChildProcess::spawn("echo", opts);
    EXPECT_GT(proc->pid(), 0);
    std::string out = read_all(proc->take_stdout());
    EXPECT_EQ(proc->take_stdout(), -1);

    EXPECT_NE(out.find("hello from env\n"), std::string::npos);
    EXPECT_NE(out.find(fs::canonical(tmp.path()).string()), std::string::npos);

    ASSERT_TRUE(wait_until([&]() { return !proc->running(); }));
    EXPECT_EQ(proc->exit_code(), std::optional<int>(0));
}

TEST(ChildProcess, MissingCommandIsSpawnFailed)
{
    SpawnOptions opts;
    opts.command = "definitely-not-a-real-command-mcphub";
    try {
        ChildProcess::spawn("ghost", opts);
        FAIL() << "expected SpawnFailed";
    } catch (const HubError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::spawn_failed);
        EXPECT_NE(std::string(e.what()).find("command not found"), std::string::npos);
    }
}

TEST(ChildProcess, MissingWorkingDirectoryIsSpawnFailed)
{
    SpawnOptions opts;
    opts.command = "true";
    opts.cwd = "/nonexistent/mcphub/dir";
    try {
        ChildProcess::spawn("nowhere", opts);
        FAIL() << "expected SpawnFailed";
    } catch (const HubError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::spawn_failed);
        EXPECT_NE(std::string(e.what()).find("working directory"), std::string::npos);
    }
}

TEST(ChildProcess, EmptyCommandIsSpawnFailed)
{
    SpawnOptions opts;
    EXPECT_THROW(ChildProcess::spawn("empty", opts), HubError);
}

TEST(ChildProcess, TerminateIsGracefulForCooperativeProcess)
{
    SpawnOptions opts;
    opts.command = "sleep";
    opts.args = {"30"};
    auto proc = ChildProcess::spawn("sleeper", opts);
    EXPECT_TRUE(proc->running());
    EXPECT_EQ(proc->terminate(2000ms), StopOutcome::graceful);
    EXPECT_FALSE(proc->running());
    EXPECT_EQ(proc->terminate(2000ms), StopOutcome::already_exited);
}

TEST(ChildProcess, TerminateForcesAfterGrace)
{
    SpawnOptions opts;
    opts.command = mcphub::testing::mock_server_path();
    opts.args = {"--ignore-term"};
    auto proc = ChildProcess::spawn("stubborn", opts);
    // Give the mock time to install its handler
    std::this_thread::sleep_for(200ms);

    auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(proc->terminate(300ms), StopOutcome::forced);
    EXPECT_GE(std::chrono::steady_clock::now() - started, 300ms);
    EXPECT_FALSE(proc->running());
    EXPECT_EQ(proc->exit_code(), std::optional<int>(128 + SIGKILL));
}

TEST(ChildProcess, CapturesStderr)
{
    SpawnOptions opts;
    opts.command = mcphub::testing::mock_server_path();
    opts.args = {"--stderr", "mock is starting up"};
    auto proc = ChildProcess::spawn("noisy", opts);
    EXPECT_TRUE(wait_until([&]() {
        return proc->stderr_tail().find("mock is starting up") != std::string::npos;
    }));
}

TEST(ChildProcess, ExitCodeOfFailedProcess)
{
    SpawnOptions opts;
    opts.command = "sh";
    opts.args = {"-c", "exit 7"};
    auto proc = ChildProcess::spawn("seven", opts);
    ASSERT_TRUE(wait_until([&]() { return !proc->running(); }));
    EXPECT_EQ(proc->exit_code(), std::optional<int>(7));
    EXPECT_EQ(proc->terminate(100ms), StopOutcome::already_exited);
}

TEST(ChildProcess, TerminatePidStopsUnownedProcess)
{
    SpawnOptions opts;
    opts.command = "sleep";
    opts.args = {"30"};
    auto proc = ChildProcess::spawn("adopted", opts);
    EXPECT_EQ(terminate_pid(proc->pid(), 2000ms), StopOutcome::graceful);
    EXPECT_FALSE(proc->running());
}

TEST(ChildProcess, TerminatePidOnMissingPid)
{
    EXPECT_EQ(terminate_pid(0, 100ms), StopOutcome::already_exited);
    EXPECT_EQ(terminate_pid(999999999, 100ms), StopOutcome::already_exited);
}

TEST(ChildProcess, OnlySpawnCreatesInstances)
{
    static_assert(!std::is_default_constructible<ChildProcess>::value, "spawn() is the only way in");
    static_assert(!std::is_copy_constructible<ChildProcess>::value, "a child has one owner");

    SpawnOptions opts;
    opts.command = "true";
    std::shared_ptr<ChildProcess> shared = ChildProcess::spawn("owned", opts);
    EXPECT_GT(shared->pid(), 0);
    ASSERT_TRUE(mcphub::testing::wait_until([&]() { return !shared->running(); }));
    EXPECT_EQ(shared->terminate(std::chrono::milliseconds(1000)), StopOutcome::already_exited);
}
