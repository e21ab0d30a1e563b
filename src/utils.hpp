#pragma once
#include <string>
#include <vector>
#include <cstdlib>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <chrono>
#include <ctime>
#include <iomanip>

namespace mcphub {

namespace fs = std::filesystem;

inline std::string home_dir() {
    const char* h = std::getenv("HOME");
    return h ? std::string(h) : ".";
}

inline std::string expand_path(const std::string& p) {
    if (p == "~") return home_dir();
    if (p.size() >= 2 && p[0] == '~' && p[1] == '/') {
        return home_dir() + p.substr(1);
    }
    return p;
}

inline std::string default_data_dir() {
    return home_dir() + "/.mcphub";
}

// .mcphub.json in the working directory wins over the per-user one.
inline std::string default_config_path() {
    std::string local = (fs::current_path() / ".mcphub.json").string();
    if (fs::exists(local)) return local;
    std::string global = default_data_dir() + "/.mcphub.json";
    if (fs::exists(global)) return global;
    return local;
}

inline std::string read_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return "";
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

inline int64_t epoch_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

inline std::string format_time(int64_t epoch) {
    std::time_t t = static_cast<std::time_t>(epoch);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

// "00:01:30" or "2 days, 01:23:45"
inline std::string format_uptime(int64_t seconds) {
    if (seconds < 0) seconds = 0;
    int64_t days = seconds / 86400;
    seconds %= 86400;
    std::ostringstream ss;
    if (days > 0) ss << days << (days == 1 ? " day, " : " days, ");
    ss << std::setw(2) << std::setfill('0') << seconds / 3600 << ":"
       << std::setw(2) << std::setfill('0') << (seconds % 3600) / 60 << ":"
       << std::setw(2) << std::setfill('0') << seconds % 60;
    return ss.str();
}

inline std::string base_name(const std::string& path) {
    auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

inline std::string join_args(const std::string& command, const std::vector<std::string>& args) {
    std::string out = command;
    for (auto& a : args) {
        if (!out.empty()) out += " ";
        out += a;
    }
    return out;
}

// Single-quote for /bin/sh.
inline std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

inline std::string truncate(const std::string& s, size_t max) {
    if (s.size() <= max) return s;
    if (max <= 3) return s.substr(0, max);
    return s.substr(0, max - 3) + "...";
}

} // namespace mcphub
