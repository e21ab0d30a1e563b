#pragma once
#include "config.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <functional>

namespace mcphub {

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the managing process's environment.
EnvLookup process_env_lookup();

// PORT and PORT_<n> are bound after port allocation, not from the environment.
bool is_port_placeholder(const std::string& name);

// Expands ${NAME} and ${NAME:-default}. Port placeholders are left untouched.
// Strict mode throws HubError(missing_env_var) on an unresolved reference;
// lenient mode leaves it in place.
std::string expand_placeholders(const std::string& value, const EnvLookup& lookup,
                                const std::string& server, bool strict = true);

// Substitutes ${PORT} (first port) and ${PORT_<n>} (n-th port, 0-based).
std::string expand_ports(const std::string& value, const std::vector<int>& ports);

// Names of every ${VAR} referenced by the launch specification.
std::vector<std::string> referenced_env_vars(const McpServerConfig& cfg);

struct ResolvedLaunch {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string cwd;
};

// Env map values are resolved first; command, args and cwd may then also refer
// to those resolved values.
ResolvedLaunch resolve_launch(const McpServerConfig& cfg, const std::string& server,
                              const EnvLookup& lookup, bool strict = true);

void bind_ports(ResolvedLaunch& launch, const std::vector<int>& ports);

} // namespace mcphub
