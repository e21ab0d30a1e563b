#pragma once
#include "config.hpp"
#include "env_resolver.hpp"
#include "process_registry.hpp"
#include "port_allocator.hpp"
#include "process_store.hpp"
#include "child_process.hpp"
#include "discovery.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <optional>
#include <functional>
#include <nlohmann/json.hpp>

namespace mcphub {

enum class LifecycleState { not_started, starting, running, stopping, stopped, crashed };

const char* lifecycle_state_name(LifecycleState s);
bool transition_allowed(LifecycleState from, LifecycleState to);

// Shared state for one hub. Tests build several side by side.
struct HubContext {
    explicit HubContext(HubSettings settings, bool persist = true);

    HubSettings settings;
    ProcessRegistry registry;
    PortAllocator ports;
    std::unique_ptr<ProcessStore> store;   // null when persistence is off
};

struct StartOptions {
    bool sse = false;
    std::optional<int> port;               // preferred port for the first slot
    std::string base_url;                  // SSE only; defaults to http://localhost:<port>
    std::string sse_path = "/sse";
    std::string message_path = "/message";
    StdioMode stdio = StdioMode::pipe;
};

struct ServerStatus {
    std::string name;
    bool configured = true;
    LifecycleState state = LifecycleState::not_started;
    ProcessStatus status = ProcessStatus::not_started;
    std::optional<int> pid;
    std::vector<int> ports;
    std::vector<int> listening_ports;
    int64_t started_at = 0;
    std::string uptime;
    std::string command;
    std::vector<std::string> warnings;

    nlohmann::json to_json() const;
};

struct HubOverview {
    std::vector<ServerStatus> servers;
    std::vector<std::string> not_found;          // configured, no matching process
    std::vector<DiscoveredProcess> unconfigured;

    nlohmann::json to_json() const;
};

// Install, start, stop and restart of named servers. Operations on one name are
// serialized by that name's lock; different names run concurrently.
class LifecycleController {
public:
    LifecycleController(const Config& cfg, HubContext& ctx,
                        EnvLookup lookup = process_env_lookup());
    ~LifecycleController();

    LifecycleController(const LifecycleController&) = delete;
    LifecycleController& operator=(const LifecycleController&) = delete;

    // Returns the existing record when the server is already running.
    ServerProcessRecord start(const std::string& name, const StartOptions& opts = {});
    StopOutcome stop(const std::string& name);
    ServerProcessRecord restart(const std::string& name, const StartOptions& opts = {});
    // Setup step only
    void install(const std::string& name);

    ServerStatus status(const std::string& name);
    HubOverview list_all();
    LifecycleState state(const std::string& name) const;

    // Stops the recorded server owning `pid`. Throws HubError(server_not_found).
    StopOutcome kill_pid(int pid, bool force);

    // Child spawned by this controller; null for adopted or stopped servers.
    std::shared_ptr<ChildProcess> child(const std::string& name) const;

    // Blocks until the server exits or `interrupted` is set. Exit code, or
    // nullopt when interrupted.
    std::optional<int> wait_for_exit(const std::string& name, const std::atomic<bool>& interrupted);

    // Running -> Crashed; called when a session sees the transport close.
    void mark_crashed(const std::string& name);

    // Stops every server spawned by this controller.
    void stop_owned();

    // Called with the reserved ports right before they are re-probed and the
    // server is spawned. Runs under the server's lock.
    using PortsReservedHook = std::function<void(const std::string& name, const std::vector<int>& ports)>;
    void on_ports_reserved(PortsReservedHook hook) { ports_reserved_ = std::move(hook); }

    HubContext& context() { return ctx_; }
    const Config& config() const { return config_; }
    const EnvLookup& lookup() const { return lookup_; }

private:
    std::mutex& name_lock(const std::string& name);
    void transition(const std::string& name, LifecycleState to);
    void force_state(const std::string& name, LifecycleState s);
    void adopt_stored();

    ServerProcessRecord start_locked(const std::string& name, const StartOptions& opts);
    StopOutcome stop_locked(const std::string& name, std::chrono::milliseconds grace);

    const Config& config_;
    HubContext& ctx_;
    EnvLookup lookup_;
    PortsReservedHook ports_reserved_;

    mutable std::mutex state_mu_;
    std::map<std::string, LifecycleState> states_;
    std::map<std::string, std::shared_ptr<ChildProcess>> children_;

    std::mutex locks_mu_;
    std::map<std::string, std::unique_ptr<std::mutex>> name_locks_;
};

} // namespace mcphub
