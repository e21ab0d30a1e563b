#pragma once
#include "config.hpp"
#include "lifecycle.hpp"
#include "stdio_session.hpp"
#include "discovery.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <chrono>

namespace mcphub {

// Owns the shared context, the lifecycle controller and one stdio session per
// server it spawned. Tool calls start their server on demand.
class Hub {
public:
    explicit Hub(Config cfg, bool persist = true, EnvLookup lookup = process_env_lookup());
    ~Hub();

    Hub(const Hub&) = delete;
    Hub& operator=(const Hub&) = delete;

    ServerProcessRecord start(const std::string& name, const StartOptions& opts = {});
    StopOutcome stop(const std::string& name);
    ServerProcessRecord restart(const std::string& name, const StartOptions& opts = {});
    void install(const std::string& name);

    ServerStatus status(const std::string& name);
    HubOverview list_all();
    DiscoveryReport scan();

    // use_cache defaults to hub.cache_tools, timeout to hub.request_timeout_ms
    std::vector<ToolDescriptor> list_tools(const std::string& name,
                                           std::optional<bool> use_cache = std::nullopt,
                                           std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    ToolResult call_tool(const std::string& name, const std::string& tool,
                         const nlohmann::json& arguments,
                         std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    void invalidate_tools(const std::string& name);

    // Closes every session and stops the servers this hub spawned.
    void shutdown();

    const Config& config() const { return config_; }
    HubContext& context() { return ctx_; }
    LifecycleController& lifecycle() { return lifecycle_; }

private:
    std::shared_ptr<StdioSession> session_for(const std::string& name);
    std::shared_ptr<StdioSession> attach(const std::string& name);
    void detach(const std::string& name);
    // Serializes start/stop and session attach for one name.
    std::mutex& attach_lock(const std::string& name);

    Config config_;
    HubContext ctx_;
    LifecycleController lifecycle_;

    std::mutex sessions_mu_;
    std::map<std::string, std::shared_ptr<StdioSession>> sessions_;
    std::mutex attach_locks_mu_;
    std::map<std::string, std::unique_ptr<std::mutex>> attach_locks_;
};

} // namespace mcphub
