#include "commands.hpp"
#include "config.hpp"
#include "hub.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <iostream>
#include <iomanip>
#include <csignal>
#include <atomic>

namespace mcphub {

static std::atomic<bool> g_interrupted{false};

static void interrupt_handler(int) {
    g_interrupted = true;
}

static std::string join_ports(const std::vector<int>& ports) {
    std::string out;
    for (int p : ports) {
        if (!out.empty()) out += ",";
        out += std::to_string(p);
    }
    return out.empty() ? "-" : out;
}

int cmd_init() {
    std::string path = (fs::current_path() / ".mcphub.json").string();
    if (fs::exists(path)) {
        std::cout << "Config already exists: " << path << "\n";
        return 0;
    }
    Config::make_default().save(path);
    std::cout << "Created " << path << "\n";
    std::cout << "Add servers under \"mcpServers\", e.g.\n"
              << "  \"fs\": {\"command\": \"npx\", \"args\": [\"-y\", \"@modelcontextprotocol/server-filesystem\", \".\"]}\n";
    return 0;
}

int cmd_list() {
    std::string cfg_path = default_config_path();
    Config cfg = Config::load(cfg_path);

    if (cfg.mcp_servers.empty()) {
        std::cout << "No MCP servers configured in " << cfg_path << "\n";
        return 0;
    }
    std::cout << "MCP servers (" << cfg_path << "):\n";
    for (auto& [name, srv] : cfg.mcp_servers) {
        std::cout << "  " << name << "\n";
        std::cout << "    command : " << join_args(srv.launch_command(), srv.launch_args()) << "\n";
        if (!srv.description.empty()) std::cout << "    about   : " << srv.description << "\n";
        if (!srv.cwd.empty()) std::cout << "    cwd     : " << srv.cwd << "\n";
        if (!srv.setup_script.empty()) std::cout << "    setup   : " << srv.setup_script << "\n";
        if (!srv.ports.empty()) std::cout << "    ports   : " << join_ports(srv.ports) << "\n";
        if (!srv.tags.empty()) std::cout << "    tags    : " << join_args("", srv.tags) << "\n";
        auto vars = referenced_env_vars(srv);
        if (!vars.empty()) std::cout << "    env vars: " << join_args("", vars) << "\n";
    }
    return 0;
}

int cmd_remove(const std::string& name) {
    std::string cfg_path = default_config_path();
    Config cfg = Config::load(cfg_path);
    if (!cfg.remove_server(name)) {
        throw HubError(ErrorKind::server_not_found, name,
                       "MCP server '" + name + "' not found in " + cfg_path);
    }
    cfg.save(cfg_path);
    std::cout << "Removed " << name << " from " << cfg_path << "\n";
    return 0;
}

int cmd_install(const std::string& name) {
    Hub hub(Config::load(default_config_path()));
    hub.install(name);
    std::cout << "Installed " << name << "\n";
    return 0;
}

int cmd_run(const std::string& name, StartOptions opts, bool restart) {
    Hub hub(Config::load(default_config_path()));
    opts.stdio = StdioMode::inherit;

    if (restart) {
        auto st = hub.lifecycle().state(name);
        if (st == LifecycleState::running || st == LifecycleState::crashed) {
            auto outcome = hub.stop(name);
            std::cout << "Stopped " << name << " (" << stop_outcome_name(outcome) << ")\n";
        }
    }

    auto rec = hub.start(name, opts);
    if (!hub.lifecycle().child(name)) {
        std::cout << name << " is already running (pid " << rec.pid.value_or(0) << ")\n";
        return 0;
    }

    std::cout << "Running " << name << " (pid " << rec.pid.value_or(0) << ")";
    if (!rec.ports.empty()) std::cout << " on port " << join_ports(rec.ports);
    std::cout << "\n";
    if (opts.sse && !rec.ports.empty()) {
        std::string base = opts.base_url.empty()
            ? "http://localhost:" + std::to_string(rec.ports.front()) : opts.base_url;
        std::cout << "  SSE endpoint     : " << base << opts.sse_path << "\n"
                  << "  Message endpoint : " << base << opts.message_path << "\n";
    }
    std::cout << "Press Ctrl+C to stop.\n";

    std::signal(SIGINT, interrupt_handler);
    std::signal(SIGTERM, interrupt_handler);

    auto code = hub.lifecycle().wait_for_exit(name, g_interrupted);
    auto outcome = hub.stop(name);
    if (!code) {
        std::cout << "Stopped " << name << " (" << stop_outcome_name(outcome) << ")\n";
        return 0;
    }
    std::cout << name << " exited with code " << *code << "\n";
    return *code == 0 ? 0 : 1;
}

int cmd_stop(const std::string& name) {
    Hub hub(Config::load(default_config_path()));
    auto outcome = hub.stop(name);
    std::cout << "Stopped " << name << " (" << stop_outcome_name(outcome) << ")\n";
    return 0;
}

int cmd_kill(int pid, bool force) {
    Hub hub(Config::load(default_config_path()));
    auto outcome = hub.lifecycle().kill_pid(pid, force);
    std::cout << "Killed pid " << pid << " (" << stop_outcome_name(outcome) << ")\n";
    return 0;
}

int cmd_ps() {
    Hub hub(Config::load(default_config_path()));
    auto names = hub.context().registry.names();
    if (names.empty()) {
        std::cout << "No MCP servers running\n";
        return 0;
    }

    std::cout << std::left
              << std::setw(20) << "NAME" << std::setw(9) << "PID" << std::setw(10) << "STATUS"
              << std::setw(14) << "PORTS" << std::setw(20) << "UPTIME" << "COMMAND\n";
    std::vector<std::string> notes;
    for (auto& n : names) {
        auto s = hub.status(n);
        std::cout << std::setw(20) << truncate(n, 19)
                  << std::setw(9) << (s.pid ? std::to_string(*s.pid) : "-")
                  << std::setw(10) << process_status_name(s.status)
                  << std::setw(14) << join_ports(s.ports)
                  << std::setw(20) << (s.uptime.empty() ? "-" : s.uptime)
                  << truncate(s.command, 60) << "\n";
        for (auto& w : s.warnings) notes.push_back(n + ": " + w);
    }
    for (auto& w : notes) std::cout << "[warn] " << w << "\n";
    return 0;
}

int cmd_status(const std::string& name) {
    Hub hub(Config::load(default_config_path()));
    auto s = hub.status(name);

    std::cout << "=== " << name << " ===\n";
    std::cout << "Configured   : " << (s.configured ? "yes" : "no") << "\n";
    std::cout << "State        : " << lifecycle_state_name(s.state) << "\n";
    std::cout << "Status       : " << process_status_name(s.status) << "\n";
    std::cout << "PID          : " << (s.pid ? std::to_string(*s.pid) : "-") << "\n";
    std::cout << "Ports        : " << join_ports(s.ports) << "\n";
    if (!s.listening_ports.empty()) {
        std::cout << "Listening    : " << join_ports(s.listening_ports) << "\n";
    }
    if (s.started_at > 0) std::cout << "Started      : " << format_time(s.started_at) << "\n";
    if (!s.uptime.empty()) std::cout << "Uptime       : " << s.uptime << "\n";
    std::cout << "Command      : " << s.command << "\n";
    for (auto& w : s.warnings) std::cout << "[warn] " << w << "\n";
    return 0;
}

int cmd_scan() {
    Hub hub(Config::load(default_config_path()));
    auto report = hub.scan();

    std::cout << "Configured and running:\n";
    if (report.configured_running.empty()) std::cout << "  (none)\n";
    for (auto& p : report.configured_running) {
        std::cout << "  " << std::left << std::setw(20) << p.matches_configured_name.value_or("?")
                  << std::setw(9) << p.pid << truncate(p.command_line, 80) << "\n";
    }
    std::cout << "Configured but not found:\n";
    if (report.configured_not_found.empty()) std::cout << "  (none)\n";
    for (auto& n : report.configured_not_found) std::cout << "  " << n << "\n";
    std::cout << "Unconfigured MCP-like processes:\n";
    if (report.unconfigured.empty()) std::cout << "  (none)\n";
    for (auto& p : report.unconfigured) {
        std::cout << "  " << std::left << std::setw(9) << p.pid << truncate(p.command_line, 100) << "\n";
    }
    return 0;
}

int cmd_tools(const std::string& name, bool no_cache) {
    Hub hub(Config::load(default_config_path()));
    std::optional<bool> use_cache;
    if (no_cache) use_cache = false;
    auto tools = hub.list_tools(name, use_cache);

    if (tools.empty()) {
        std::cout << name << " exposes no tools\n";
        return 0;
    }
    for (auto& t : tools) {
        std::cout << t.name;
        if (!t.description.empty()) std::cout << " - " << truncate(t.description, 100);
        std::cout << "\n";
        if (t.parameter_schema.contains("properties") && t.parameter_schema["properties"].is_object()) {
            for (auto& [param, schema] : t.parameter_schema["properties"].items()) {
                std::string type = "any";
                if (schema.is_object() && schema.contains("type") && schema["type"].is_string()) {
                    type = schema["type"].get<std::string>();
                }
                std::cout << "    " << param << ": " << type << "\n";
            }
        }
    }
    return 0;
}

int cmd_call(const std::string& name, const std::string& tool, const std::string& args_json) {
    nlohmann::json args = nlohmann::json::object();
    if (!args_json.empty()) {
        try {
            args = nlohmann::json::parse(args_json);
        } catch (const nlohmann::json::parse_error& e) {
            throw HubError(ErrorKind::config_error, name,
                           std::string("tool arguments are not valid JSON: ") + e.what());
        }
    }

    Hub hub(Config::load(default_config_path()));
    auto result = hub.call_tool(name, tool, args);
    std::string text = result.text();
    std::cout << (text.empty() ? result.content.dump(2) : text) << "\n";
    if (!result.structured.is_null()) std::cout << result.structured.dump(2) << "\n";
    return result.is_error ? 1 : 0;
}

} // namespace mcphub
