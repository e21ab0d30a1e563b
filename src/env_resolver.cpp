#include "env_resolver.hpp"
#include "errors.hpp"
#include <cstdlib>
#include <cctype>
#include <set>

namespace mcphub {

EnvLookup process_env_lookup() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* v = std::getenv(name.c_str());
        if (!v) return std::nullopt;
        return std::string(v);
    };
}

bool is_port_placeholder(const std::string& name) {
    if (name == "PORT") return true;
    if (name.size() > 5 && name.compare(0, 5, "PORT_") == 0) {
        for (size_t i = 5; i < name.size(); i++) {
            if (!std::isdigit(static_cast<unsigned char>(name[i]))) return false;
        }
        return true;
    }
    return false;
}

namespace {

// Calls fn(name, default_or_null) for every ${...} in value and splices in
// whatever it returns; nullopt keeps the original text.
template <typename Fn>
std::string substitute(const std::string& value, Fn&& fn) {
    std::string out;
    out.reserve(value.size());
    size_t i = 0;
    while (i < value.size()) {
        if (value[i] == '$' && i + 1 < value.size() && value[i + 1] == '{') {
            size_t close = value.find('}', i + 2);
            if (close == std::string::npos) {
                out.append(value, i, std::string::npos);
                break;
            }
            std::string body = value.substr(i + 2, close - i - 2);
            std::string name = body;
            std::optional<std::string> def;
            auto sep = body.find(":-");
            if (sep != std::string::npos) {
                name = body.substr(0, sep);
                def = body.substr(sep + 2);
            }
            auto repl = fn(name, def);
            if (repl) out += *repl;
            else out.append(value, i, close - i + 1);
            i = close + 1;
            continue;
        }
        out += value[i++];
    }
    return out;
}

// Slot index of a port placeholder; nullopt when the index is too large to
// name any declared port.
std::optional<size_t> port_slot(const std::string& name) {
    if (name == "PORT") return 0;
    std::string digits = name.substr(5);
    if (digits.size() > 4) return std::nullopt;
    return static_cast<size_t>(std::stoul(digits));
}

} // namespace

std::string expand_placeholders(const std::string& value, const EnvLookup& lookup,
                                const std::string& server, bool strict) {
    return substitute(value, [&](const std::string& name, const std::optional<std::string>& def)
                                 -> std::optional<std::string> {
        if (is_port_placeholder(name)) {
            if (strict && !port_slot(name)) {
                throw HubError(ErrorKind::config_error, server,
                               "${" + name + "} does not name a declared port");
            }
            return std::nullopt;
        }
        if (auto v = lookup(name)) return v;
        if (def) return def;
        if (strict) {
            throw HubError(ErrorKind::missing_env_var, server,
                           "environment variable " + name + " is not set and has no default");
        }
        return std::nullopt;
    });
}

std::string expand_ports(const std::string& value, const std::vector<int>& ports) {
    return substitute(value, [&](const std::string& name, const std::optional<std::string>&)
                                 -> std::optional<std::string> {
        if (!is_port_placeholder(name) || ports.empty()) return std::nullopt;
        auto idx = port_slot(name);
        if (!idx || *idx >= ports.size()) return std::nullopt;
        return std::to_string(ports[*idx]);
    });
}

std::vector<std::string> referenced_env_vars(const McpServerConfig& cfg) {
    std::vector<std::string> names;
    std::set<std::string> seen;
    auto collect = [&](const std::string& v) {
        substitute(v, [&](const std::string& name, const std::optional<std::string>&)
                          -> std::optional<std::string> {
            if (!is_port_placeholder(name) && seen.insert(name).second) names.push_back(name);
            return std::nullopt;
        });
    };
    collect(cfg.command);
    for (auto& a : cfg.args) collect(a);
    for (auto& [_, v] : cfg.env) collect(v);
    collect(cfg.cwd);
    return names;
}

ResolvedLaunch resolve_launch(const McpServerConfig& cfg, const std::string& server,
                              const EnvLookup& lookup, bool strict) {
    ResolvedLaunch out;
    for (auto& [k, v] : cfg.env) {
        out.env[k] = expand_placeholders(v, lookup, server, strict);
    }

    EnvLookup with_env = [&](const std::string& name) -> std::optional<std::string> {
        if (auto v = lookup(name)) return v;
        auto it = out.env.find(name);
        if (it != out.env.end()) return it->second;
        return std::nullopt;
    };

    out.command = expand_placeholders(cfg.launch_command(), with_env, server, strict);
    for (auto& a : cfg.launch_args()) {
        out.args.push_back(expand_placeholders(a, with_env, server, strict));
    }
    out.cwd = expand_path(expand_placeholders(cfg.cwd, with_env, server, strict));
    return out;
}

void bind_ports(ResolvedLaunch& launch, const std::vector<int>& ports) {
    for (auto& a : launch.args) a = expand_ports(a, ports);
    for (auto& [_, v] : launch.env) v = expand_ports(v, ports);
    if (!ports.empty() && !launch.env.count("PORT")) {
        launch.env["PORT"] = std::to_string(ports.front());
    }
}

} // namespace mcphub
