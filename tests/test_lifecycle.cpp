#include <gtest/gtest.h>

#include "lifecycle.hpp"
#include "errors.hpp"
#include "proc_table.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <future>
#include <set>
#include <vector>

using namespace mcphub;
using namespace mcphub::testing;
using namespace std::chrono_literals;

namespace {

ErrorKind kind_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const HubError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected a HubError";
    return ErrorKind::config_error;
}

class LifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.hub = test_settings(tmp.path());
        config.mcp_servers["mock"] = mock_server();
        config.mcp_servers["stubborn"] = mock_server({"--ignore-term"});
    }

    std::unique_ptr<HubContext> make_context(bool persist = false) {
        return std::make_unique<HubContext>(config.hub, persist);
    }

    TempDir tmp;
    Config config;
};

} // namespace

TEST(LifecycleStates, TransitionTable)
{
    using S = LifecycleState;
    EXPECT_TRUE(transition_allowed(S::not_started, S::starting));
    EXPECT_TRUE(transition_allowed(S::starting, S::running));
    EXPECT_TRUE(transition_allowed(S::starting, S::not_started));
    EXPECT_TRUE(transition_allowed(S::running, S::stopping));
    EXPECT_TRUE(transition_allowed(S::running, S::crashed));
    EXPECT_TRUE(transition_allowed(S::stopping, S::stopped));
    EXPECT_TRUE(transition_allowed(S::stopped, S::starting));
    EXPECT_TRUE(transition_allowed(S::crashed, S::starting));

    EXPECT_FALSE(transition_allowed(S::not_started, S::running));
    EXPECT_FALSE(transition_allowed(S::running, S::starting));
    EXPECT_FALSE(transition_allowed(S::stopped, S::stopping));
    EXPECT_FALSE(transition_allowed(S::stopping, S::running));
    EXPECT_STREQ(lifecycle_state_name(S::not_started), "NotStarted");
}

TEST_F(LifecycleTest, StartAndStop)
{
    auto ctx = make_context();
    LifecycleController lc(config, *ctx, map_lookup({}));

    EXPECT_EQ(lc.state("mock"), LifecycleState::not_started);
    auto rec = lc.start("mock");
    ASSERT_TRUE(rec.pid.has_value());
    EXPECT_EQ(rec.status, ProcessStatus::running);
    EXPECT_EQ(lc.state("mock"), LifecycleState::running);
    EXPECT_EQ(ctx->registry.refresh_status("mock"), ProcessStatus::running);
    ASSERT_NE(lc.child("mock"), nullptr);

    auto st = lc.status("mock");
    EXPECT_EQ(st.pid, rec.pid);
    EXPECT_FALSE(st.uptime.empty());

    EXPECT_EQ(lc.stop("mock"), StopOutcome::graceful);
    EXPECT_EQ(lc.state("mock"), LifecycleState::stopped);
    EXPECT_FALSE(ctx->registry.find("mock").has_value());
    EXPECT_EQ(lc.child("mock"), nullptr);
    EXPECT_FALSE(read_proc(*rec.pid).has_value());
}

TEST_F(LifecycleTest, StartWhenRunningReturnsExistingRecord)
{
    auto ctx = make_context();
    LifecycleController lc(config, *ctx, map_lookup({}));
    auto first = lc.start("mock");
    auto second = lc.start("mock");
    EXPECT_EQ(first.pid, second.pid);
}

TEST_F(LifecycleTest, ConcurrentStartsSpawnOneProcess)
{
    auto ctx = make_context();
    LifecycleController lc(config, *ctx, map_lookup({}));

    std::vector<std::future<std::optional<int>>> starts;
    for (int i = 0; i < 8; i++) {
        starts.push_back(std::async(std::launch::async, [&]() { return lc.start("mock").pid; }));
    }
    std::set<int> pids;
    for (auto& f : starts) {
        auto pid = f.get();
        ASSERT_TRUE(pid.has_value());
        pids.insert(*pid);
    }
    EXPECT_EQ(pids.size(), 1u);
    EXPECT_EQ(ctx->registry.all().size(), 1u);
}

TEST_F(LifecycleTest, DifferentServersStartIndependently)
{
    config.mcp_servers["other"] = mock_server({"--stderr", "other"});
    auto ctx = make_context();
    LifecycleController lc(config, *ctx, map_lookup({}));

    auto a = std::async(std::launch::async, [&]() { return lc.start("mock"); });
    auto b = std::async(std::launch::async, [&]() { return lc.start("other"); });
    EXPECT_NE(a.get().pid, b.get().pid);
    EXPECT_EQ(ctx->registry.names(), (std::vector<std::string>{"mock", "other"}));
}

TEST_F(LifecycleTest, SetupFailureLeavesNothingBehind)
{
    auto srv = mock_server();
    srv.setup_script = "echo 'npm ERR! 404 not found'; exit 1";
    srv.ports = {0};
    config.mcp_servers["broken"] = srv;
    auto ctx = make_context();
    LifecycleController lc(config, *ctx, map_lookup({}));

    try {
        lc.start("broken");
        FAIL() << "expected SetupFailed";
    } catch (const HubError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::setup_failed);
        EXPECT_NE(e.output().find("npm ERR! 404"), std::string::npos);
    }
    EXPECT_EQ(lc.state("broken"), LifecycleState::not_started);
    EXPECT_TRUE(ctx->ports.bindings().empty());
    EXPECT_FALSE(ctx->registry.find("broken").has_value());
}

TEST_F(LifecycleTest, SetupRunsBeforeStart)
{
    auto srv = mock_server();
    srv.setup_script = "touch installed.flag";
    srv.cwd = tmp.path();
    config.mcp_servers["with_setup"] = srv;
    auto ctx = make_context();
    LifecycleController lc(config, *ctx, map_lookup({}));

    lc.start("with_setup");
    EXPECT_TRUE(fs::exists(tmp.file("installed.flag")));
    EXPECT_EQ(lc.state("with_setup"), LifecycleState::running);
}

TEST_F(LifecycleTest, InstallRunsOnlySetup)
{
    auto srv = mock_server();
    srv.setup_script = "echo \"$GREETING\" > greeting.txt";
    srv.cwd = tmp.path();
    srv.env = {{"GREETING", "${WHO}"}};
    config.mcp_servers["installable"] = srv;
    auto ctx = make_context();
    LifecycleController lc(config, *ctx, map_lookup({{"WHO", "hi"}}));

    lc.install("installable");
    EXPECT_EQ(read_file(tmp.file("greeting.txt")), "hi\n");
    EXPECT_EQ(lc.state("installable"), LifecycleState::not_started);
    EXPECT_TRUE(ctx->registry.names().empty());
}

TEST_F(LifecycleTest, MissingVariableFailsStart)
{
    auto srv = mock_server({"--token", "${API_TOKEN}"});
    config.mcp_servers["needs_env"] = srv;
    auto ctx = make_context();
    LifecycleController lc(config, *ctx, map_lookup({}));

    EXPECT_EQ(kind_of([&]() { lc.start("needs_env"); }), ErrorKind::missing_env_var);
    EXPECT_EQ(lc.state("needs_env"), LifecycleState::not_started);
}

TEST_F(LifecycleTest, SpawnFailureRestoresState)
{
    McpServerConfig srv;
    srv.command = "/nonexistent/bin/mcp-server";
    srv.ports = {0};
    config.mcp_servers["ghost"] = srv;
    auto ctx = make_context();
    LifecycleController lc(config, *ctx, map_lookup({}));

    EXPECT_EQ(kind_of([&]() { lc.start("ghost"); }), ErrorKind::spawn_failed);
    EXPECT_EQ(lc.state("ghost"), LifecycleState::not_started);
    EXPECT_TRUE(ctx->ports.bindings().empty());
}

TEST_F(LifecycleTest, UnknownServer)
{
    auto ctx = make_context();
    LifecycleController lc(config, *ctx, map_lookup({}));
    EXPECT_EQ(kind_of([&]() { lc.start("nope"); }), ErrorKind::server_not_found);
    EXPECT_EQ(kind_of([&]() { lc.install("nope"); }), ErrorKind::server_not_found);
    EXPECT_EQ(kind_of([&]() { lc.status("nope"); }), ErrorKind::server_not_found);
}

TEST_F(LifecycleTest, PreferredPortBoundElsewhereMovesToNext)
{
    int preferred = config.hub.port_base + 5;
    PortHolder holder(preferred);
    ASSERT_TRUE(holder.held());

    auto srv = mock_server({"--listen"});
    srv.ports = {preferred};
    config.mcp_servers["web"] = srv;
    auto ctx = make_context();
    LifecycleController lc(config, *ctx, map_lookup({}));

    auto rec = lc.start("web");
    ASSERT_EQ(rec.ports.size(), 1u);
    EXPECT_NE(rec.ports[0], preferred);
    EXPECT_GT(rec.ports[0], preferred);
    EXPECT_EQ(rec.env.at("PORT"), std::to_string(rec.ports[0]));
    EXPECT_TRUE(ctx->ports.is_reserved(rec.ports[0]));

    // The mock binds $PORT; the registry sees the listener
    EXPECT_TRUE(wait_until([&]() {
        ctx->registry.refresh_status("web");
        auto r = ctx->registry.find("web");
        return r && !r->listening_ports.empty();
    }));
    EXPECT_EQ(ctx->registry.find("web")->listening_ports, rec.ports);

    lc.stop("web");
    EXPECT_FALSE(ctx->ports.is_reserved(rec.ports[0]));
}

TEST_F(LifecycleTest, StartOptionPortOverridesConfig)
{
    auto srv = mock_server({"--port", "${PORT}"});
    srv.ports = {0};
    config.mcp_servers["web"] = srv;
    auto ctx = make_context();
    LifecycleController lc(config, *ctx, map_lookup({}));

    StartOptions opts;
    opts.port = config.hub.port_base + 7;
    auto rec = lc.start("web", opts);
    EXPECT_EQ(rec.ports, std::vector<int>{config.hub.port_base + 7});
    ASSERT_EQ(rec.args.size(), 2u);
    EXPECT_EQ(rec.args[1], std::to_string(config.hub.port_base + 7));
}

TEST_F(LifecycleTest, StopWhenNotRunningIsInvalidTransition)
{
    auto ctx = make_context();
    LifecycleController lc(config, *ctx, map_lookup({}));
    EXPECT_EQ(kind_of([&]() { lc.stop("mock"); }), ErrorKind::invalid_transition);

    lc.start("mock");
    lc.stop("mock");
    EXPECT_EQ(kind_of([&]() { lc.stop("mock"); }), ErrorKind::invalid_transition);
}

TEST_F(LifecycleTest, StubbornServerIsKilled)
{
    config.hub.stop_grace_ms = 300;
    auto ctx = make_context();
    LifecycleController lc(config, *ctx, map_lookup({}));

    lc.start("stubborn");
    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(lc.stop("stubborn"), StopOutcome::forced);
    EXPECT_EQ(lc.state("stubborn"), LifecycleState::stopped);
}

TEST_F(LifecycleTest, ExternalKillIsDetectedAsCrash)
{
    auto ctx = make_context();
    LifecycleController lc(config, *ctx, map_lookup({}));
    auto rec = lc.start("mock");

    ::kill(*rec.pid, SIGKILL);
    ASSERT_TRUE(wait_until([&]() { return !lc.child("mock")->running(); }));

    auto st = lc.status("mock");
    EXPECT_EQ(st.state, LifecycleState::crashed);
    EXPECT_EQ(st.status, ProcessStatus::stopped);
    EXPECT_TRUE(st.uptime.empty());

    // A crashed server starts again cleanly
    auto again = lc.start("mock");
    EXPECT_NE(again.pid, rec.pid);
    EXPECT_EQ(lc.state("mock"), LifecycleState::running);
}

TEST_F(LifecycleTest, CrashedServerCanBeStopped)
{
    auto ctx = make_context();
    LifecycleController lc(config, *ctx, map_lookup({}));
    auto rec = lc.start("mock");
    ::kill(*rec.pid, SIGKILL);
    ASSERT_TRUE(wait_until([&]() { return !lc.child("mock")->running(); }));
    lc.mark_crashed("mock");

    EXPECT_EQ(lc.stop("mock"), StopOutcome::already_exited);
    EXPECT_EQ(lc.state("mock"), LifecycleState::stopped);
}

TEST_F(LifecycleTest, RestartSpawnsNewProcess)
{
    auto ctx = make_context();
    LifecycleController lc(config, *ctx, map_lookup({}));
    auto first = lc.start("mock");
    auto second = lc.restart("mock");
    EXPECT_NE(first.pid, second.pid);
    EXPECT_EQ(lc.state("mock"), LifecycleState::running);
    EXPECT_FALSE(read_proc(*first.pid).has_value());

    // Restart of a never-started server is a plain start
    config.mcp_servers["fresh"] = mock_server();
    auto fresh = lc.restart("fresh");
    EXPECT_TRUE(fresh.pid.has_value());
}

TEST_F(LifecycleTest, WaitForExitReportsExitCode)
{
    McpServerConfig srv;
    srv.command = "sh";
    srv.args = {"-c", "sleep 0.3; exit 4"};
    config.mcp_servers["short"] = srv;
    auto ctx = make_context();
    LifecycleController lc(config, *ctx, map_lookup({}));

    lc.start("short");
    std::atomic<bool> interrupted{false};
    EXPECT_EQ(lc.wait_for_exit("short", interrupted), std::optional<int>(4));
    EXPECT_EQ(lc.state("short"), LifecycleState::crashed);
}

TEST_F(LifecycleTest, WaitForExitStopsOnInterrupt)
{
    auto ctx = make_context();
    LifecycleController lc(config, *ctx, map_lookup({}));
    lc.start("mock");
    std::atomic<bool> interrupted{true};
    EXPECT_FALSE(lc.wait_for_exit("mock", interrupted).has_value());
}

TEST_F(LifecycleTest, KillByPid)
{
    auto ctx = make_context();
    LifecycleController lc(config, *ctx, map_lookup({}));
    EXPECT_EQ(kind_of([&]() { lc.kill_pid(999999999, false); }), ErrorKind::server_not_found);

    auto rec = lc.start("mock");
    auto outcome = lc.kill_pid(*rec.pid, true);
    EXPECT_NE(outcome, StopOutcome::already_exited);
    EXPECT_EQ(lc.state("mock"), LifecycleState::stopped);
}

TEST_F(LifecycleTest, SecondControllerAdoptsStoredServer)
{
    auto ctx_a = make_context(true);
    LifecycleController a(config, *ctx_a, map_lookup({}));
    auto rec = a.start("mock");
    ASSERT_TRUE(ctx_a->store->get("mock").has_value());

    auto ctx_b = make_context(true);
    LifecycleController b(config, *ctx_b, map_lookup({}));
    EXPECT_EQ(b.state("mock"), LifecycleState::running);
    EXPECT_EQ(b.child("mock"), nullptr);
    EXPECT_EQ(b.status("mock").pid, rec.pid);

    // b did not spawn it, so it stops it through the pid
    EXPECT_EQ(b.stop("mock"), StopOutcome::graceful);
    EXPECT_FALSE(ctx_b->store->get("mock").has_value());
    EXPECT_TRUE(wait_until([&]() { return !a.child("mock")->running(); }));
}

TEST_F(LifecycleTest, StaleStoredRecordIsDropped)
{
    {
        ProcessStore store(config.hub.data_path() + "/processes.db");
        ServerProcessRecord rec;
        rec.name = "mock";
        rec.pid = 999999999;
        rec.command = mock_server_path();
        store.save(rec);
    }
    auto ctx = make_context(true);
    LifecycleController lc(config, *ctx, map_lookup({}));
    EXPECT_EQ(lc.state("mock"), LifecycleState::not_started);
    EXPECT_FALSE(ctx->registry.find("mock").has_value());
    EXPECT_FALSE(ctx->store->get("mock").has_value());
}

TEST_F(LifecycleTest, ListAllCoversConfiguredServers)
{
    auto ctx = make_context();
    LifecycleController lc(config, *ctx, map_lookup({}));
    lc.start("mock");

    auto overview = lc.list_all();
    ASSERT_EQ(overview.servers.size(), 2u);
    EXPECT_EQ(overview.servers[0].name, "mock");
    EXPECT_EQ(overview.servers[0].state, LifecycleState::running);
    EXPECT_EQ(overview.servers[1].name, "stubborn");
    EXPECT_EQ(overview.servers[1].state, LifecycleState::not_started);
    EXPECT_EQ(overview.servers[1].status, ProcessStatus::not_started);

    auto j = overview.to_json();
    EXPECT_EQ(j["servers"][0]["state"], "Running");
    EXPECT_TRUE(j["servers"][1]["pid"].is_null());
}

TEST_F(LifecycleTest, DestructorStopsOwnedServers)
{
    std::optional<int> pid;
    {
        auto ctx = make_context();
        LifecycleController lc(config, *ctx, map_lookup({}));
        pid = lc.start("mock").pid;
    }
    ASSERT_TRUE(pid.has_value());
    EXPECT_FALSE(read_proc(*pid).has_value());
}

TEST_F(LifecycleTest, OutOfBandKillShowsInOverview)
{
    config.mcp_servers["s1"] = mock_server({"--stderr", "s1"});
    config.mcp_servers["s2"] = mock_server({"--stderr", "s2"});
    auto ctx = make_context();
    LifecycleController lc(config, *ctx, map_lookup({}));
    lc.start("s1");
    auto s2 = lc.start("s2");

    // Unrelated process that looks like an MCP server: argv is
    // ["uvx", "-c", "sleep 30; true", "mcp-server-unlisted"]
    SpawnOptions stray;
    stray.command = "bash";
    stray.args = {"-c", "exec -a uvx bash -c 'sleep 30; true' mcp-server-unlisted"};
    auto unrelated = ChildProcess::spawn("stray", stray);

    ::kill(*s2.pid, SIGKILL);
    ASSERT_TRUE(wait_until([&]() { return !lc.child("s2")->running(); }));

    HubOverview overview;
    ASSERT_TRUE(wait_until([&]() {
        overview = lc.list_all();
        return std::any_of(overview.unconfigured.begin(), overview.unconfigured.end(),
                           [&](const DiscoveredProcess& p) { return p.pid == unrelated->pid(); });
    }));

    auto& missing = overview.not_found;
    EXPECT_NE(std::find(missing.begin(), missing.end(), "s2"), missing.end());
    EXPECT_EQ(std::find(missing.begin(), missing.end(), "s1"), missing.end());
    for (auto& s : overview.servers) {
        if (s.name == "s2") EXPECT_EQ(s.state, LifecycleState::crashed);
        if (s.name == "s1") EXPECT_EQ(s.state, LifecycleState::running);
    }
}

TEST_F(LifecycleTest, PortTakenAfterReservationIsPortConflict)
{
    auto srv = mock_server();
    srv.ports = {0};
    config.mcp_servers["racy"] = srv;
    auto ctx = make_context();
    LifecycleController lc(config, *ctx, map_lookup({}));

    std::unique_ptr<PortHolder> intruder;
    int reserved = 0;
    lc.on_ports_reserved([&](const std::string&, const std::vector<int>& ports) {
        reserved = ports.front();
        intruder = std::make_unique<PortHolder>(reserved);
    });

    EXPECT_EQ(kind_of([&]() { lc.start("racy"); }), ErrorKind::port_conflict);
    ASSERT_NE(intruder, nullptr);
    EXPECT_TRUE(intruder->held());
    EXPECT_EQ(lc.state("racy"), LifecycleState::not_started);
    EXPECT_TRUE(ctx->ports.ports_of("racy").empty());
    EXPECT_FALSE(ctx->registry.find("racy").has_value());
    EXPECT_EQ(lc.child("racy"), nullptr);

    // Next attempt moves past the taken port
    lc.on_ports_reserved(nullptr);
    auto rec = lc.start("racy");
    ASSERT_EQ(rec.ports.size(), 1u);
    EXPECT_NE(rec.ports[0], reserved);
    lc.stop("racy");
}
