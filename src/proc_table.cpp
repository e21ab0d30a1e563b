#include "proc_table.hpp"
#include "utils.hpp"
#include <set>
#include <algorithm>
#include <sstream>
#include <cctype>
#include <unistd.h>

namespace mcphub {

std::string ProcInfo::command_line() const {
    std::string out;
    for (auto& a : argv) {
        if (!out.empty()) out += " ";
        out += a;
    }
    return out;
}

static int64_t boot_time() {
    static int64_t cached = -1;
    if (cached >= 0) return cached;
    std::ifstream f("/proc/stat");
    std::string key;
    while (f >> key) {
        if (key == "btime") {
            f >> cached;
            return cached;
        }
        f.ignore(4096, '\n');
    }
    cached = 0;
    return cached;
}

std::optional<ProcInfo> read_proc(int pid) {
    if (pid <= 0) return std::nullopt;
    std::string base = "/proc/" + std::to_string(pid);

    std::string stat = read_file(base + "/stat");
    if (stat.empty()) return std::nullopt;

    // comm may contain spaces and parens; fields resume after the last ')'
    auto rp = stat.rfind(')');
    if (rp == std::string::npos || rp + 2 >= stat.size()) return std::nullopt;

    ProcInfo info;
    info.pid = pid;

    std::istringstream ss(stat.substr(rp + 2));
    std::string field;
    std::vector<std::string> fields;
    while (ss >> field) fields.push_back(field);
    // fields[0] = state (3rd stat field), fields[19] = starttime (22nd)
    if (fields.size() < 20) return std::nullopt;
    info.state = fields[0].empty() ? '?' : fields[0][0];
    try {
        info.ppid = std::stoi(fields[1]);
        long ticks = sysconf(_SC_CLK_TCK);
        if (ticks <= 0) ticks = 100;
        info.start_time = boot_time() + static_cast<int64_t>(std::stoull(fields[19]) / ticks);
    } catch (const std::exception&) {
        return std::nullopt;
    }

    std::string cmdline = read_file(base + "/cmdline");
    std::string cur;
    for (char c : cmdline) {
        if (c == '\0') {
            info.argv.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    if (!cur.empty()) info.argv.push_back(cur);
    return info;
}

std::vector<ProcInfo> snapshot_processes() {
    std::vector<ProcInfo> procs;
    std::error_code ec;
    for (auto& entry : fs::directory_iterator("/proc", ec)) {
        auto name = entry.path().filename().string();
        if (name.empty() || !std::all_of(name.begin(), name.end(),
                                          [](unsigned char c) { return std::isdigit(c); })) {
            continue;
        }
        // processes can vanish between readdir and read
        if (auto p = read_proc(std::stoi(name))) procs.push_back(std::move(*p));
    }
    return procs;
}

static std::set<std::string> socket_inodes(int pid) {
    std::set<std::string> inodes;
    std::error_code ec;
    fs::path fd_dir = "/proc/" + std::to_string(pid) + "/fd";
    for (auto& entry : fs::directory_iterator(fd_dir, ec)) {
        std::error_code lec;
        auto target = fs::read_symlink(entry.path(), lec).string();
        if (lec) continue;
        // socket:[12345]
        if (target.compare(0, 8, "socket:[") == 0 && target.back() == ']') {
            inodes.insert(target.substr(8, target.size() - 9));
        }
    }
    return inodes;
}

std::vector<int> listening_ports(int pid) {
    auto inodes = socket_inodes(pid);
    std::set<int> ports;
    if (inodes.empty()) return {};

    for (auto table : {"/proc/net/tcp", "/proc/net/tcp6"}) {
        std::ifstream f(table);
        std::string line;
        std::getline(f, line);  // header
        while (std::getline(f, line)) {
            std::istringstream ls(line);
            std::string sl, local, remote, st, queues, timer, retr, uid, timeout, inode;
            if (!(ls >> sl >> local >> remote >> st >> queues >> timer >> retr >> uid >> timeout >> inode)) {
                continue;
            }
            if (st != "0A") continue;  // LISTEN
            if (!inodes.count(inode)) continue;
            auto colon = local.rfind(':');
            if (colon == std::string::npos) continue;
            try {
                ports.insert(std::stoi(local.substr(colon + 1), nullptr, 16));
            } catch (const std::exception&) {
                continue;  // malformed row
            }
        }
    }
    return {ports.begin(), ports.end()};
}

// "python" matches "python3.11", "npx" matches "npx-cli.js"
static bool exe_matches(const std::string& candidate, const std::string& exe) {
    auto base = base_name(candidate);
    if (base == exe) return true;
    if (base.size() > exe.size() && base.compare(0, exe.size(), exe) == 0) {
        char next = base[exe.size()];
        return next == '-' || next == '.' || next == '_' ||
               std::isdigit(static_cast<unsigned char>(next));
    }
    return false;
}

bool command_matches(const std::vector<std::string>& argv,
                     const std::string& command,
                     const std::vector<std::string>& args) {
    if (argv.empty() || command.empty()) return false;
    std::string exe = base_name(command);

    // A process that rewrote its title (npm does) leaves one space-joined entry
    std::vector<std::string> live = argv;
    bool retitled = live.size() == 1 && live[0].find(' ') != std::string::npos;
    if (retitled) {
        std::istringstream ss(live[0]);
        live.clear();
        std::string tok;
        while (ss >> tok) live.push_back(tok);
    }

    size_t start = std::string::npos;
    for (size_t i = 0; i < live.size() && i < 2; i++) {
        if (exe_matches(live[i], exe)) {
            start = i + 1;
            break;
        }
        // npx runs as "npm exec ..."
        if (exe == "npx" && base_name(live[i]) == "npm" &&
            i + 1 < live.size() && live[i + 1] == "exec") {
            start = i + 2;
            break;
        }
    }
    if (start == std::string::npos) return false;

    // npm drops npx's own -y/--yes when it retitles or re-execs
    std::vector<std::string> wanted;
    for (auto& a : args) {
        if (exe == "npx" && (a == "-y" || a == "--yes")) continue;
        wanted.push_back(a);
    }

    if (retitled) {
        // Argument boundaries are lost; look for each argument in order
        std::string rest;
        for (size_t i = start; i < live.size(); i++) rest += " " + live[i];
        size_t at = 0;
        for (auto& want : wanted) {
            at = rest.find(want, at);
            if (at == std::string::npos) return false;
            at += want.size();
        }
        return true;
    }

    size_t pos = start;
    for (auto& want : wanted) {
        while (pos < live.size() && live[pos] != want) pos++;
        if (pos == live.size()) return false;
        pos++;
    }
    return true;
}

} // namespace mcphub
