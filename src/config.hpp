#pragma once
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace mcphub {

// Launch specification of one server, as written in .mcphub.json.
struct McpServerConfig {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;   // values may hold ${VAR} placeholders
    std::string cwd;
    std::string setup_script;                 // run once before every start, if set
    std::vector<int> ports;                   // 0 = any free port

    // Informational, carried through for `list`
    std::string package_name;
    std::string repo_url;
    std::string description;
    std::vector<std::string> tags;

    // npx -y <package> when only a package name was given
    std::string launch_command() const;
    std::vector<std::string> launch_args() const;
};

struct HubSettings {
    std::string data_dir = "~/.mcphub";
    int port_base = 3000;
    int port_attempts = 100;
    int stop_grace_ms = 5000;
    int request_timeout_ms = 30000;
    int setup_timeout_s = 600;
    bool cache_tools = true;

    std::string data_path() const { return expand_path(data_dir); }
};

struct Config {
    HubSettings hub;
    std::map<std::string, McpServerConfig> mcp_servers;

    bool has_server(const std::string& name) const { return mcp_servers.count(name) > 0; }
    // Throws HubError(server_not_found)
    const McpServerConfig& server(const std::string& name) const;

    bool remove_server(const std::string& name);

    static Config make_default();
    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

McpServerConfig server_from_json(const nlohmann::json& j);
nlohmann::json server_to_json(const McpServerConfig& srv);

} // namespace mcphub
