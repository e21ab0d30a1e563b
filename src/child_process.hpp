#pragma once
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <chrono>
#include <optional>
#include <atomic>
#include <sys/types.h>

namespace mcphub {

enum class StdioMode {
    pipe,      // stdin/stdout/stderr are pipes owned by the parent
    inherit,   // share the parent's terminal
};

struct SpawnOptions {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;   // overlaid on the parent's environment
    std::string cwd;
    StdioMode stdio = StdioMode::pipe;
    // Own process group, so stop() also reaches grandchildren (npx -> node)
    bool new_process_group = true;
};

enum class StopOutcome { graceful, forced, already_exited };

const char* stop_outcome_name(StopOutcome o);

// A forked child. Exec failures are reported back through a close-on-exec pipe
// so spawn() either returns a process that has exec'd or throws SpawnFailed.
class ChildProcess {
    struct Token {
        explicit Token() = default;
    };

public:
    static std::unique_ptr<ChildProcess> spawn(const std::string& server, const SpawnOptions& opts);

    // Only spawn() can name Token.
    explicit ChildProcess(Token) {}
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }

    // Ownership of the pipe ends passes to the caller; -1 afterwards.
    int take_stdin();
    int take_stdout();

    // Reaps the child if it has exited.
    bool running();
    std::optional<int> exit_code() const;

    // SIGTERM, wait up to `grace`, then SIGKILL. Always reaps.
    StopOutcome terminate(std::chrono::milliseconds grace);

    // Last 64 KiB written to stderr (pipe mode only).
    std::string stderr_tail() const;

private:
    void drain_stderr();
    void record_status(int status);
    void signal(int sig);

    std::string server_;
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    bool own_group_ = false;
    bool reaped_ = false;
    std::optional<int> exit_code_;
    std::mutex state_mu_;

    mutable std::mutex stderr_mu_;
    std::string stderr_buf_;
    std::thread stderr_thread_;
    std::atomic<bool> stop_drain_{false};
};

// Stops a process this program did not spawn (e.g. recorded by an earlier run).
// It cannot be reaped here, so exit is detected by polling /proc.
StopOutcome terminate_pid(pid_t pid, std::chrono::milliseconds grace);

} // namespace mcphub
