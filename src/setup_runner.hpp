#pragma once
#include <string>
#include <map>

namespace mcphub {

struct SetupResult {
    int exit_code = 0;
    bool timed_out = false;
    std::string output;   // stdout and stderr, interleaved

    bool ok() const { return exit_code == 0 && !timed_out; }
};

// Runs a setup script through /bin/sh in `cwd`, bounded by `timeout_s`.
// Output beyond max_output bytes is cut.
SetupResult run_setup(const std::string& script, const std::string& cwd,
                      const std::map<std::string, std::string>& env,
                      int timeout_s, size_t max_output = 256 * 1024);

// Throws HubError(setup_failed) carrying the captured output.
void run_setup_checked(const std::string& server, const std::string& script,
                       const std::string& cwd,
                       const std::map<std::string, std::string>& env, int timeout_s);

} // namespace mcphub
