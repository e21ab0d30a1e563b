#include "setup_runner.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <cstdio>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <sys/wait.h>

namespace mcphub {

static std::string build_command(const std::string& script, const std::string& cwd,
                                 const std::map<std::string, std::string>& env,
                                 int timeout_s) {
    std::string inner;
    if (!cwd.empty()) {
        inner = "cd " + shell_quote(cwd) + " && ";
    }
    inner += script;

    std::string full_cmd;
    if (timeout_s > 0) {
        full_cmd = "timeout " + std::to_string(timeout_s) + " ";
    }
    if (!env.empty()) {
        full_cmd += "env";
        for (auto& [k, v] : env) full_cmd += " " + shell_quote(k + "=" + v);
        full_cmd += " ";
    }
    full_cmd += "sh -c " + shell_quote(inner) + " 2>&1 </dev/null";
    return full_cmd;
}

SetupResult run_setup(const std::string& script, const std::string& cwd,
                      const std::map<std::string, std::string>& env,
                      int timeout_s, size_t max_output) {
    SetupResult res;
    std::string full_cmd = build_command(script, cwd, env, timeout_s);

    FILE* pipe = ::popen(full_cmd.c_str(), "r");
    if (!pipe) {
        res.exit_code = -1;
        res.output = std::string("failed to run setup script: ") + std::strerror(errno);
        return res;
    }

    char buffer[4096];
    bool truncated = false;
    size_t n;
    while ((n = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        if (truncated) continue;  // keep draining so the script never blocks on a full pipe
        res.output.append(buffer, n);
        if (res.output.size() > max_output) {
            res.output.resize(max_output);
            res.output += "\n...[truncated]";
            truncated = true;
        }
    }
    int status = ::pclose(pipe);

    if (status == -1) {
        res.exit_code = -1;
    } else if (WIFEXITED(status)) {
        res.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res.exit_code = 128 + WTERMSIG(status);
    }
    // coreutils timeout exits 124 when the limit fires
    if (timeout_s > 0 && res.exit_code == 124) res.timed_out = true;
    return res;
}

void run_setup_checked(const std::string& server, const std::string& script,
                       const std::string& cwd,
                       const std::map<std::string, std::string>& env, int timeout_s) {
    std::cerr << "[setup:" << server << "] Running: " << truncate(script, 120) << "\n";
    auto res = run_setup(script, cwd, env, timeout_s);
    if (res.timed_out) {
        throw HubError(ErrorKind::setup_failed, server,
                       "setup script timed out after " + std::to_string(timeout_s) + "s",
                       res.output);
    }
    if (!res.ok()) {
        throw HubError(ErrorKind::setup_failed, server,
                       "setup script exited with code " + std::to_string(res.exit_code),
                       res.output);
    }
    std::cerr << "[setup:" << server << "] Done\n";
}

} // namespace mcphub
