#include "child_process.hpp"
#include "errors.hpp"
#include "proc_table.hpp"
#include <iostream>
#include <cstring>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/wait.h>

extern char** environ;

namespace mcphub {

static constexpr size_t STDERR_LIMIT = 64 * 1024;

const char* stop_outcome_name(StopOutcome o) {
    switch (o) {
    case StopOutcome::graceful:       return "graceful";
    case StopOutcome::forced:         return "forced";
    case StopOutcome::already_exited: return "already exited";
    }
    return "unknown";
}

static void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

static void ignore_sigpipe() {
    // A write to a dead server's stdin must surface as EPIPE, not kill the hub.
    static bool done = false;
    if (!done) {
        std::signal(SIGPIPE, SIG_IGN);
        done = true;
    }
}

// envp for the child, built before fork so the child never allocates.
static std::vector<std::string> build_environment(const std::map<std::string, std::string>& overlay) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e && *e; ++e) {
        std::string entry = *e;
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        merged[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    for (auto& [k, v] : overlay) merged[k] = v;

    std::vector<std::string> out;
    out.reserve(merged.size());
    for (auto& [k, v] : merged) out.push_back(k + "=" + v);
    return out;
}

std::unique_ptr<ChildProcess> ChildProcess::spawn(const std::string& server, const SpawnOptions& opts) {
    if (opts.command.empty()) {
        throw HubError(ErrorKind::spawn_failed, server, "no command specified");
    }
    ignore_sigpipe();

    std::vector<std::string> env_strings = build_environment(opts.env);
    std::vector<char*> envp;
    for (auto& s : env_strings) envp.push_back(const_cast<char*>(s.c_str()));
    envp.push_back(nullptr);

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(opts.command.c_str()));
    for (auto& a : opts.args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    bool piped = opts.stdio == StdioMode::pipe;
    int pipe_stdin[2] = {-1, -1};
    int pipe_stdout[2] = {-1, -1};
    int pipe_stderr[2] = {-1, -1};
    int pipe_err[2] = {-1, -1};

    auto close_all = [&]() {
        for (int* p : {pipe_stdin, pipe_stdout, pipe_stderr, pipe_err}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    // O_CLOEXEC on every end: dup2 clears it on the child's 0/1/2, and sibling
    // servers spawned later never inherit our ends.
    if (::pipe2(pipe_err, O_CLOEXEC) != 0 ||
        (piped && (::pipe2(pipe_stdin, O_CLOEXEC) != 0 ||
                   ::pipe2(pipe_stdout, O_CLOEXEC) != 0 ||
                   ::pipe2(pipe_stderr, O_CLOEXEC) != 0))) {
        int err = errno;
        close_all();
        throw HubError(ErrorKind::spawn_failed, server,
                       std::string("failed to create pipes: ") + std::strerror(err));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        close_all();
        throw HubError(ErrorKind::spawn_failed, server,
                       std::string("fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child process: only async-signal-safe calls from here on
        auto fail = [&](int err) {
            ssize_t w = ::write(pipe_err[1], &err, sizeof(err));
            (void)w;
            _exit(127);
        };
        if (piped) {
            if (::dup2(pipe_stdin[0], STDIN_FILENO) < 0 ||
                ::dup2(pipe_stdout[1], STDOUT_FILENO) < 0 ||
                ::dup2(pipe_stderr[1], STDERR_FILENO) < 0) {
                fail(errno);
            }
        }
        if (opts.new_process_group && ::setpgid(0, 0) != 0) fail(errno);
        if (!opts.cwd.empty() && ::chdir(opts.cwd.c_str()) != 0) fail(errno);
        ::execvpe(opts.command.c_str(), argv.data(), envp.data());
        fail(errno);
    }

    // Parent process
    close_fd(pipe_err[1]);
    close_fd(pipe_stdin[0]);
    close_fd(pipe_stdout[1]);
    close_fd(pipe_stderr[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(pipe_err[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(pipe_err[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        close_all();
        std::string what = child_errno == ENOENT ? "command not found: " + opts.command
                         : child_errno == EACCES ? "permission denied: " + opts.command
                         : "exec " + opts.command + " failed";
        if (!opts.cwd.empty() && child_errno == ENOENT && ::access(opts.cwd.c_str(), F_OK) != 0) {
            what = "working directory does not exist: " + opts.cwd;
        }
        throw HubError(ErrorKind::spawn_failed, server,
                       what + " (" + std::strerror(child_errno) + ")");
    }

    auto child = std::make_unique<ChildProcess>(Token{});
    child->server_ = server;
    child->pid_ = pid;
    child->stdin_fd_ = pipe_stdin[1];
    child->stdout_fd_ = pipe_stdout[0];
    child->stderr_fd_ = pipe_stderr[0];
    child->own_group_ = opts.new_process_group;
    if (piped) {
        child->stderr_thread_ = std::thread(&ChildProcess::drain_stderr, child.get());
    }

    std::cerr << "[lifecycle:" << server << "] Spawned pid " << pid << ": " << opts.command << "\n";
    return child;
}

ChildProcess::~ChildProcess() {
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    if (running()) terminate(std::chrono::milliseconds(2000));
    stop_drain_ = true;
    if (stderr_thread_.joinable()) stderr_thread_.join();
    close_fd(stderr_fd_);
}

int ChildProcess::take_stdin() {
    int fd = stdin_fd_;
    stdin_fd_ = -1;
    return fd;
}

int ChildProcess::take_stdout() {
    int fd = stdout_fd_;
    stdout_fd_ = -1;
    return fd;
}

void ChildProcess::record_status(int status) {
    reaped_ = true;
    if (WIFEXITED(status)) exit_code_ = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) exit_code_ = 128 + WTERMSIG(status);
}

bool ChildProcess::running() {
    std::lock_guard<std::mutex> lock(state_mu_);
    if (reaped_ || pid_ <= 0) return false;
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == 0) return true;
    if (r == pid_) record_status(status);
    else reaped_ = true;  // ECHILD: reaped elsewhere
    return false;
}

std::optional<int> ChildProcess::exit_code() const {
    return exit_code_;
}

void ChildProcess::signal(int sig) {
    if (own_group_ && ::kill(-pid_, sig) == 0) return;
    ::kill(pid_, sig);
}

StopOutcome ChildProcess::terminate(std::chrono::milliseconds grace) {
    if (!running()) return StopOutcome::already_exited;

    std::lock_guard<std::mutex> lock(state_mu_);
    int status = 0;
    signal(SIGTERM);

    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        pid_t r = ::waitpid(pid_, &status, WNOHANG);
        if (r == pid_) {
            record_status(status);
            return StopOutcome::graceful;
        }
        if (r < 0) {
            reaped_ = true;
            return StopOutcome::graceful;
        }
        ::usleep(50000);
    }

    std::cerr << "[lifecycle:" << server_ << "] pid " << pid_
              << " ignored SIGTERM, sending SIGKILL\n";
    signal(SIGKILL);
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);
    if (r == pid_) record_status(status);
    else reaped_ = true;
    return StopOutcome::forced;
}

void ChildProcess::drain_stderr() {
    // Grandchildren may keep stderr open after the child exits, so the loop
    // also watches stop_drain_.
    char buf[4096];
    while (!stop_drain_) {
        pollfd pfd{stderr_fd_, POLLIN, 0};
        int ret = ::poll(&pfd, 1, 200);
        if (ret < 0 && errno == EINTR) continue;
        if (ret < 0) break;
        if (ret == 0) continue;
        ssize_t n = ::read(stderr_fd_, buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        std::lock_guard<std::mutex> lock(stderr_mu_);
        stderr_buf_.append(buf, static_cast<size_t>(n));
        if (stderr_buf_.size() > STDERR_LIMIT) {
            stderr_buf_.erase(0, stderr_buf_.size() - STDERR_LIMIT);
        }
    }
}

std::string ChildProcess::stderr_tail() const {
    std::lock_guard<std::mutex> lock(stderr_mu_);
    return stderr_buf_;
}

// ── Processes from an earlier invocation ──

static bool pid_gone(pid_t pid) {
    auto info = read_proc(pid);
    return !info || info->zombie();
}

StopOutcome terminate_pid(pid_t pid, std::chrono::milliseconds grace) {
    if (pid <= 0 || pid_gone(pid)) return StopOutcome::already_exited;

    // Servers spawned by mcphub lead their own process group
    bool group = ::getpgid(pid) == pid;
    auto send = [&](int sig) {
        if (group && ::kill(-pid, sig) == 0) return 0;
        return ::kill(pid, sig);
    };

    if (send(SIGTERM) != 0) {
        if (errno == ESRCH) return StopOutcome::already_exited;
        throw std::runtime_error("cannot signal pid " + std::to_string(pid) + ": " +
                                 std::strerror(errno));
    }

    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pid_gone(pid)) return StopOutcome::graceful;
        ::usleep(50000);
    }

    std::cerr << "[lifecycle] pid " << pid << " ignored SIGTERM, sending SIGKILL\n";
    send(SIGKILL);
    for (int i = 0; i < 40 && !pid_gone(pid); i++) ::usleep(50000);
    return StopOutcome::forced;
}

} // namespace mcphub
