#include "config.hpp"
#include "errors.hpp"
#include <fstream>
#include <iostream>

namespace mcphub {

std::string McpServerConfig::launch_command() const {
    if (command.empty() && !package_name.empty()) return "npx";
    return command;
}

std::vector<std::string> McpServerConfig::launch_args() const {
    if (command.empty() && !package_name.empty()) {
        std::vector<std::string> a = {"-y", package_name};
        a.insert(a.end(), args.begin(), args.end());
        return a;
    }
    return args;
}

const McpServerConfig& Config::server(const std::string& name) const {
    auto it = mcp_servers.find(name);
    if (it == mcp_servers.end()) {
        throw HubError(ErrorKind::server_not_found, name,
                       "MCP server '" + name + "' not found in configuration");
    }
    return it->second;
}

bool Config::remove_server(const std::string& name) {
    return mcp_servers.erase(name) > 0;
}

Config Config::make_default() {
    return Config{};
}

static std::vector<std::string> parse_string_array(const nlohmann::json& arr) {
    std::vector<std::string> result;
    if (arr.is_array()) {
        for (auto& item : arr) {
            if (item.is_string()) result.push_back(item.get<std::string>());
        }
    }
    return result;
}

static std::string first_string(const nlohmann::json& j, std::initializer_list<const char*> keys) {
    for (auto k : keys) {
        if (j.contains(k) && j[k].is_string()) return j[k].get<std::string>();
    }
    return "";
}

McpServerConfig server_from_json(const nlohmann::json& srv) {
    McpServerConfig mcp;
    if (!srv.is_object()) return mcp;

    mcp.command = srv.value("command", "");
    if (srv.contains("args")) mcp.args = parse_string_array(srv["args"]);
    if (srv.contains("env") && srv["env"].is_object()) {
        for (auto& [ek, ev] : srv["env"].items()) {
            if (ev.is_string()) mcp.env[ek] = ev.get<std::string>();
            else if (ev.is_number() || ev.is_boolean()) mcp.env[ek] = ev.dump();
        }
    }
    mcp.cwd = first_string(srv, {"cwd", "workingDirectory", "working_directory"});
    mcp.setup_script = first_string(srv, {"setup_script", "setupScript"});
    if (srv.contains("ports") && srv["ports"].is_array()) {
        for (auto& p : srv["ports"]) {
            if (p.is_number_integer()) mcp.ports.push_back(p.get<int>());
        }
    }
    mcp.package_name = srv.value("package_name", "");
    mcp.repo_url = srv.value("repo_url", "");
    mcp.description = srv.value("description", "");
    if (srv.contains("tags")) mcp.tags = parse_string_array(srv["tags"]);
    return mcp;
}

nlohmann::json server_to_json(const McpServerConfig& srv) {
    nlohmann::json s = nlohmann::json::object();
    if (!srv.command.empty()) s["command"] = srv.command;
    if (!srv.args.empty()) s["args"] = srv.args;
    if (!srv.env.empty()) s["env"] = srv.env;
    if (!srv.cwd.empty()) s["cwd"] = srv.cwd;
    if (!srv.setup_script.empty()) s["setup_script"] = srv.setup_script;
    if (!srv.ports.empty()) s["ports"] = srv.ports;
    if (!srv.package_name.empty()) s["package_name"] = srv.package_name;
    if (!srv.repo_url.empty()) s["repo_url"] = srv.repo_url;
    if (!srv.description.empty()) s["description"] = srv.description;
    if (!srv.tags.empty()) s["tags"] = srv.tags;
    return s;
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;

    HubSettings defaults;
    nlohmann::json h = nlohmann::json::object();
    if (hub.data_dir != defaults.data_dir) h["data_dir"] = hub.data_dir;
    if (hub.port_base != defaults.port_base) h["port_base"] = hub.port_base;
    if (hub.port_attempts != defaults.port_attempts) h["port_attempts"] = hub.port_attempts;
    if (hub.stop_grace_ms != defaults.stop_grace_ms) h["stop_grace_ms"] = hub.stop_grace_ms;
    if (hub.request_timeout_ms != defaults.request_timeout_ms) h["request_timeout_ms"] = hub.request_timeout_ms;
    if (hub.setup_timeout_s != defaults.setup_timeout_s) h["setup_timeout_s"] = hub.setup_timeout_s;
    if (hub.cache_tools != defaults.cache_tools) h["cache_tools"] = hub.cache_tools;
    if (!h.empty()) j["hub"] = h;

    j["mcpServers"] = nlohmann::json::object();
    for (auto& [name, srv] : mcp_servers) {
        j["mcpServers"][name] = server_to_json(srv);
    }
    return j;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c;

    if (j.contains("hub") && j["hub"].is_object()) {
        auto& h = j["hub"];
        c.hub.data_dir = h.value("data_dir", c.hub.data_dir);
        c.hub.port_base = h.value("port_base", c.hub.port_base);
        c.hub.port_attempts = h.value("port_attempts", c.hub.port_attempts);
        c.hub.stop_grace_ms = h.value("stop_grace_ms", c.hub.stop_grace_ms);
        c.hub.request_timeout_ms = h.value("request_timeout_ms", c.hub.request_timeout_ms);
        c.hub.setup_timeout_s = h.value("setup_timeout_s", c.hub.setup_timeout_s);
        c.hub.cache_tools = h.value("cache_tools", c.hub.cache_tools);
    }

    // "mcp_servers" is accepted too; "mcpServers" wins when both are present
    for (auto key : {"mcp_servers", "mcpServers"}) {
        if (!j.contains(key) || !j[key].is_object()) continue;
        for (auto& [name, srv] : j[key].items()) {
            c.mcp_servers[name] = server_from_json(srv);
        }
    }

    return c;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[warn] Config not found at " << path << ", using defaults\n";
        return make_default();
    }
    try {
        nlohmann::json j = nlohmann::json::parse(f);
        return from_json(j);
    } catch (const std::exception& e) {
        std::cerr << "[warn] Failed to parse config: " << e.what() << ", using defaults\n";
        return make_default();
    }
}

void Config::save(const std::string& path) const {
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent);
    std::ofstream f(path);
    if (!f) {
        throw HubError(ErrorKind::config_error, "", "cannot write config file " + path);
    }
    f << to_json().dump(2) << std::endl;
}

} // namespace mcphub
