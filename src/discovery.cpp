#include "discovery.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <set>
#include <unistd.h>

namespace mcphub {

nlohmann::json DiscoveredProcess::to_json() const {
    nlohmann::json j = {{"pid", pid}, {"command_line", command_line}};
    j["matches_configured_name"] = matches_configured_name ? nlohmann::json(*matches_configured_name)
                                                           : nlohmann::json();
    return j;
}

nlohmann::json DiscoveryReport::to_json() const {
    nlohmann::json running = nlohmann::json::array();
    for (auto& p : configured_running) running.push_back(p.to_json());
    nlohmann::json other = nlohmann::json::array();
    for (auto& p : unconfigured) other.push_back(p.to_json());
    return {
        {"configured_running", running},
        {"configured_not_found", configured_not_found},
        {"unconfigured", other}
    };
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool has_marker(const std::vector<std::string>& argv, size_t from) {
    for (size_t i = from; i < argv.size(); i++) {
        std::string a = lower(argv[i]);
        if (a.find("mcp") != std::string::npos) return true;
        if (a.find("modelcontextprotocol") != std::string::npos) return true;
    }
    return false;
}

static bool contains(const std::vector<std::string>& argv, size_t from, const std::string& s) {
    return std::find(argv.begin() + std::min(from, argv.size()), argv.end(), s) != argv.end();
}

bool looks_like_mcp_server(const std::vector<std::string>& argv) {
    if (argv.empty()) return false;

    // npm retitles itself to a single space-joined entry
    std::vector<std::string> live = argv;
    if (live.size() == 1 && live[0].find(' ') != std::string::npos) {
        std::istringstream ss(live[0]);
        live.clear();
        std::string tok;
        while (ss >> tok) live.push_back(tok);
    }

    std::string exe = base_name(live[0]);
    bool runner = false;
    if (exe == "npx" || exe == "uvx" || exe == "bunx" || exe == "deno" ||
        exe == "supergateway" || exe == "node" || exe == "nodejs") {
        runner = true;
    } else if (exe == "uv") {
        runner = live.size() > 1 && live[1] == "run";
    } else if (exe == "npm") {
        runner = live.size() > 1 && live[1] == "exec";
    } else if (exe == "docker") {
        runner = live.size() > 1 && live[1] == "run";
    } else if (exe.compare(0, 6, "python") == 0) {
        runner = contains(live, 1, "-m");
    }
    return runner && has_marker(live, 1);
}

DiscoveryScanner::DiscoveryScanner(const Config& cfg, const ProcessRegistry* registry,
                                   EnvLookup lookup)
    : config_(cfg), registry_(registry), lookup_(std::move(lookup)),
      self_pid_(static_cast<int>(::getpid())) {}

DiscoveryReport DiscoveryScanner::scan() const {
    return scan(snapshot_processes());
}

std::optional<std::string> DiscoveryScanner::match_configured(const ProcInfo& p) const {
    // The registry's own pid is authoritative when it has one
    if (registry_) {
        if (auto name = registry_->name_for_pid(p.pid)) {
            if (config_.has_server(*name)) return name;
        }
    }

    for (auto& [name, cfg] : config_.mcp_servers) {
        if (registry_) {
            auto rec = registry_->find(name);
            if (rec && command_matches(p.argv, rec->command, rec->args)) return name;
        }

        ResolvedLaunch launch;
        try {
            launch = resolve_launch(cfg, name, lookup_, false);
        } catch (const std::exception& e) {
            std::cerr << "[scan] Cannot resolve " << name << ": " << e.what() << "\n";
            continue;
        }
        // Unbound placeholders (ports, missing variables) match anything
        std::vector<std::string> args;
        for (auto& a : launch.args) {
            if (a.find("${") == std::string::npos) args.push_back(a);
        }
        if (command_matches(p.argv, launch.command, args)) return name;
    }
    return std::nullopt;
}

DiscoveryReport DiscoveryScanner::scan(const std::vector<ProcInfo>& table) const {
    DiscoveryReport report;
    std::set<std::string> found;
    std::map<int, std::string> owner_of;   // pid -> configured name
    std::map<int, int> parent_of;
    for (auto& p : table) parent_of[p.pid] = p.ppid;

    for (auto& p : table) {
        if (p.pid == self_pid_ || p.zombie() || p.argv.empty()) continue;
        auto name = match_configured(p);
        if (!name) continue;
        owner_of[p.pid] = *name;
        found.insert(*name);
        report.configured_running.push_back({p.pid, p.command_line(), name});
    }

    // Children of a configured server (npx -> node) belong to it
    auto owned_ancestor = [&](int pid) -> bool {
        for (int depth = 0; depth < 16; depth++) {
            auto it = parent_of.find(pid);
            if (it == parent_of.end() || it->second <= 1) return false;
            pid = it->second;
            if (owner_of.count(pid)) return true;
        }
        return false;
    };

    for (auto& p : table) {
        if (p.pid == self_pid_ || p.zombie() || p.argv.empty()) continue;
        if (owner_of.count(p.pid)) continue;
        if (!looks_like_mcp_server(p.argv)) continue;
        if (owned_ancestor(p.pid)) continue;
        report.unconfigured.push_back({p.pid, p.command_line(), std::nullopt});
    }

    for (auto& [name, _] : config_.mcp_servers) {
        if (!found.count(name)) report.configured_not_found.push_back(name);
    }

    std::cerr << "[scan] " << table.size() << " processes: "
              << report.configured_running.size() << " configured, "
              << report.configured_not_found.size() << " not found, "
              << report.unconfigured.size() << " unconfigured\n";
    return report;
}

} // namespace mcphub
