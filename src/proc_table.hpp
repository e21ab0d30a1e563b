#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace mcphub {

// One row of the OS process table, read from /proc.
struct ProcInfo {
    int pid = 0;
    int ppid = 0;
    char state = '?';             // R, S, D, Z, T, ...
    std::vector<std::string> argv;
    int64_t start_time = 0;       // epoch seconds

    bool zombie() const { return state == 'Z'; }
    std::string command_line() const;
};

std::optional<ProcInfo> read_proc(int pid);
std::vector<ProcInfo> snapshot_processes();

// TCP ports in LISTEN state owned by the pid's sockets. Empty when the pid's
// fd table is not readable.
std::vector<int> listening_ports(int pid);

// True if argv looks like an invocation of command with args (in order).
// Interpreter launchers are tolerated: "npx" matches "node .../npx-cli.js".
bool command_matches(const std::vector<std::string>& argv,
                     const std::string& command,
                     const std::vector<std::string>& args);

} // namespace mcphub
