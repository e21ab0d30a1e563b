#pragma once
#include "config.hpp"
#include "env_resolver.hpp"
#include "proc_table.hpp"
#include "process_registry.hpp"
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace mcphub {

struct DiscoveredProcess {
    int pid = 0;
    std::string command_line;
    std::optional<std::string> matches_configured_name;

    nlohmann::json to_json() const;
};

struct DiscoveryReport {
    std::vector<DiscoveredProcess> configured_running;
    std::vector<std::string> configured_not_found;
    std::vector<DiscoveredProcess> unconfigured;

    nlohmann::json to_json() const;
};

// Known server runner (npx, uvx, uv run, node, python -m, docker run,
// supergateway, bunx, deno) invoked with an MCP marker in its arguments.
bool looks_like_mcp_server(const std::vector<std::string>& argv);

// Cross-references the configuration and the registry against a process table.
// Never signals or otherwise touches the processes it sees.
class DiscoveryScanner {
public:
    DiscoveryScanner(const Config& cfg, const ProcessRegistry* registry = nullptr,
                     EnvLookup lookup = process_env_lookup());

    DiscoveryReport scan() const;
    DiscoveryReport scan(const std::vector<ProcInfo>& table) const;

    // Pid treated as our own; defaults to getpid().
    void set_self_pid(int pid) { self_pid_ = pid; }

private:
    std::optional<std::string> match_configured(const ProcInfo& p) const;

    const Config& config_;
    const ProcessRegistry* registry_;
    EnvLookup lookup_;
    int self_pid_;
};

} // namespace mcphub
