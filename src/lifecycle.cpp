#include "lifecycle.hpp"
#include "setup_runner.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <iostream>
#include <cctype>
#include <thread>
#include <chrono>

namespace mcphub {

const char* lifecycle_state_name(LifecycleState s) {
    switch (s) {
    case LifecycleState::not_started: return "NotStarted";
    case LifecycleState::starting:    return "Starting";
    case LifecycleState::running:     return "Running";
    case LifecycleState::stopping:    return "Stopping";
    case LifecycleState::stopped:     return "Stopped";
    case LifecycleState::crashed:     return "Crashed";
    }
    return "Unknown";
}

bool transition_allowed(LifecycleState from, LifecycleState to) {
    using S = LifecycleState;
    switch (from) {
    case S::not_started: return to == S::starting;
    // A failed start falls back to wherever it came from
    case S::starting:    return to == S::running || to == S::not_started ||
                                to == S::stopped || to == S::crashed;
    case S::running:     return to == S::stopping || to == S::crashed;
    case S::stopping:    return to == S::stopped;
    case S::stopped:     return to == S::starting;
    case S::crashed:     return to == S::starting || to == S::stopped;
    }
    return false;
}

HubContext::HubContext(HubSettings s, bool persist)
    : settings(std::move(s)), ports(settings.port_base, settings.port_attempts) {
    if (persist) {
        store = std::make_unique<ProcessStore>(settings.data_path() + "/processes.db");
    }
}

nlohmann::json ServerStatus::to_json() const {
    nlohmann::json j = {
        {"name", name},
        {"configured", configured},
        {"state", lifecycle_state_name(state)},
        {"status", process_status_name(status)},
        {"ports", ports},
        {"listening_ports", listening_ports},
        {"command", command},
        {"warnings", warnings}
    };
    j["pid"] = pid ? nlohmann::json(*pid) : nlohmann::json();
    if (started_at > 0) {
        j["started_at"] = format_time(started_at);
    } else {
        j["started_at"] = nullptr;
    }
    j["uptime"] = uptime.empty() ? nlohmann::json() : nlohmann::json(uptime);
    return j;
}

nlohmann::json HubOverview::to_json() const {
    nlohmann::json servers_json = nlohmann::json::array();
    for (auto& s : servers) servers_json.push_back(s.to_json());
    nlohmann::json other = nlohmann::json::array();
    for (auto& p : unconfigured) other.push_back(p.to_json());
    return {{"servers", servers_json}, {"not_found", not_found}, {"unconfigured", other}};
}

static bool needs_quoting(const std::string& s) {
    if (s.empty()) return true;
    for (char c : s) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ||
              c == '.' || c == '/' || c == '@' || c == ':' || c == '=' || c == ',')) {
            return true;
        }
    }
    return false;
}

// npx -y supergateway --stdio "<cmd>" --port P ...
static void wrap_for_sse(ResolvedLaunch& launch, int port, const StartOptions& opts) {
    std::string inner = needs_quoting(launch.command) ? shell_quote(launch.command) : launch.command;
    for (auto& a : launch.args) {
        inner += " " + (needs_quoting(a) ? shell_quote(a) : a);
    }
    std::string base_url = opts.base_url.empty()
        ? "http://localhost:" + std::to_string(port) : opts.base_url;

    launch.command = "npx";
    launch.args = {
        "-y", "supergateway",
        "--stdio", inner,
        "--port", std::to_string(port),
        "--baseUrl", base_url,
        "--ssePath", opts.sse_path,
        "--messagePath", opts.message_path
    };
}

LifecycleController::LifecycleController(const Config& cfg, HubContext& ctx, EnvLookup lookup)
    : config_(cfg), ctx_(ctx), lookup_(std::move(lookup)) {
    adopt_stored();
}

LifecycleController::~LifecycleController() {
    stop_owned();
}

void LifecycleController::adopt_stored() {
    if (!ctx_.store) return;
    for (auto& rec : ctx_.store->list()) {
        std::string name = rec.name;
        std::vector<int> ports = rec.ports;
        int pid = rec.pid.value_or(0);
        ctx_.registry.register_record(std::move(rec));

        auto ps = ctx_.registry.refresh_status(name);
        if (ps == ProcessStatus::running) {
            for (int p : ports) {
                if (!ctx_.ports.adopt(p, name)) {
                    std::cerr << "[warn] Port " << p << " of " << name
                              << " is already reserved by another server\n";
                }
            }
            force_state(name, LifecycleState::running);
            std::cerr << "[registry] Adopted " << name << " (pid " << pid << ")\n";
        } else if (ps == ProcessStatus::zombie) {
            force_state(name, LifecycleState::crashed);
            std::cerr << "[warn] " << name << " (pid " << pid << ") is a zombie\n";
        } else {
            std::cerr << "[store] Dropping stale record for " << name
                      << " (pid " << pid << " is " << process_status_name(ps) << ")\n";
            ctx_.registry.forget(name);
            ctx_.store->remove(name);
        }
    }
}

std::mutex& LifecycleController::name_lock(const std::string& name) {
    std::lock_guard<std::mutex> lock(locks_mu_);
    auto& m = name_locks_[name];
    if (!m) m = std::make_unique<std::mutex>();
    return *m;
}

LifecycleState LifecycleController::state(const std::string& name) const {
    std::lock_guard<std::mutex> lock(state_mu_);
    auto it = states_.find(name);
    return it == states_.end() ? LifecycleState::not_started : it->second;
}

void LifecycleController::transition(const std::string& name, LifecycleState to) {
    std::lock_guard<std::mutex> lock(state_mu_);
    auto it = states_.find(name);
    LifecycleState from = it == states_.end() ? LifecycleState::not_started : it->second;
    if (!transition_allowed(from, to)) {
        throw HubError(ErrorKind::invalid_transition, name,
                       std::string("cannot go from ") + lifecycle_state_name(from) +
                       " to " + lifecycle_state_name(to));
    }
    states_[name] = to;
    std::cerr << "[lifecycle:" << name << "] " << lifecycle_state_name(from)
              << " -> " << lifecycle_state_name(to) << "\n";
}

void LifecycleController::force_state(const std::string& name, LifecycleState s) {
    std::lock_guard<std::mutex> lock(state_mu_);
    states_[name] = s;
}

void LifecycleController::mark_crashed(const std::string& name) {
    std::lock_guard<std::mutex> lock(state_mu_);
    auto it = states_.find(name);
    if (it == states_.end() || it->second != LifecycleState::running) return;
    it->second = LifecycleState::crashed;
    std::cerr << "[lifecycle:" << name << "] Running -> Crashed\n";
}

std::shared_ptr<ChildProcess> LifecycleController::child(const std::string& name) const {
    std::lock_guard<std::mutex> lock(state_mu_);
    auto it = children_.find(name);
    return it == children_.end() ? nullptr : it->second;
}

// ── Start ──

ServerProcessRecord LifecycleController::start(const std::string& name, const StartOptions& opts) {
    std::lock_guard<std::mutex> lock(name_lock(name));
    return start_locked(name, opts);
}

ServerProcessRecord LifecycleController::start_locked(const std::string& name, const StartOptions& opts) {
    const McpServerConfig& cfg = config_.server(name);
    LifecycleState prior = state(name);

    if (prior == LifecycleState::running) {
        if (ctx_.registry.refresh_status(name) == ProcessStatus::running) {
            std::cerr << "[lifecycle:" << name << "] Already running\n";
            return *ctx_.registry.find(name);
        }
        mark_crashed(name);
        prior = LifecycleState::crashed;
    }
    if (prior == LifecycleState::crashed) {
        // Leftovers of the dead process
        ctx_.ports.release_owner(name);
        ctx_.registry.forget(name);
        if (ctx_.store) ctx_.store->remove(name);
        std::lock_guard<std::mutex> lock(state_mu_);
        children_.erase(name);
    }

    transition(name, LifecycleState::starting);

    try {
        if (!cfg.setup_script.empty()) {
            auto setup = resolve_launch(cfg, name, lookup_, false);
            run_setup_checked(name, cfg.setup_script, setup.cwd, setup.env,
                              ctx_.settings.setup_timeout_s);
        }

        ResolvedLaunch launch = resolve_launch(cfg, name, lookup_, true);

        std::vector<int> ports;
        for (size_t i = 0; i < cfg.ports.size(); i++) {
            std::optional<int> preferred;
            if (i == 0 && opts.port) preferred = *opts.port;
            else if (cfg.ports[i] > 0) preferred = cfg.ports[i];
            ports.push_back(ctx_.ports.allocate(name, preferred));
        }
        if (opts.sse && ports.empty()) {
            ports.push_back(ctx_.ports.allocate(name, opts.port));
        }
        bind_ports(launch, ports);
        if (opts.sse) wrap_for_sse(launch, ports.front(), opts);
        if (ports_reserved_ && !ports.empty()) ports_reserved_(name, ports);

        // Something may have bound a reserved port since it was probed
        for (int p : ports) {
            if (!PortAllocator::os_port_free(p)) {
                throw HubError(ErrorKind::port_conflict, name,
                               "port " + std::to_string(p) + " was taken before the server started");
            }
        }

        SpawnOptions spawn_opts;
        spawn_opts.command = launch.command;
        spawn_opts.args = launch.args;
        spawn_opts.env = launch.env;
        spawn_opts.cwd = launch.cwd;
        spawn_opts.stdio = opts.stdio;
        // A foreground server stays in the terminal's group and gets its Ctrl+C
        spawn_opts.new_process_group = opts.stdio == StdioMode::pipe;
        std::shared_ptr<ChildProcess> proc = ChildProcess::spawn(name, spawn_opts);

        ServerProcessRecord rec;
        rec.name = name;
        rec.pid = static_cast<int>(proc->pid());
        rec.command = launch.command;
        rec.args = launch.args;
        rec.working_directory = launch.cwd;
        rec.env = launch.env;
        rec.status = ProcessStatus::running;
        rec.started_at = epoch_now();
        rec.ports = ports;

        ctx_.registry.register_record(rec);
        if (ctx_.store) {
            try {
                ctx_.store->save(rec);
            } catch (const std::runtime_error& e) {
                std::cerr << "[warn] " << name << " will not be visible to other invocations: "
                          << e.what() << "\n";
            }
        }
        {
            std::lock_guard<std::mutex> lock(state_mu_);
            children_[name] = proc;
        }
        transition(name, LifecycleState::running);

        std::cerr << "[lifecycle:" << name << "] Started pid " << *rec.pid;
        if (!ports.empty()) {
            std::cerr << " on port";
            for (int p : ports) std::cerr << " " << p;
        }
        std::cerr << "\n";
        return rec;
    } catch (...) {
        ctx_.ports.release_owner(name);
        force_state(name, prior);
        std::cerr << "[lifecycle:" << name << "] Start failed, back to "
                  << lifecycle_state_name(prior) << "\n";
        throw;
    }
}

// ── Stop ──

StopOutcome LifecycleController::stop(const std::string& name) {
    std::lock_guard<std::mutex> lock(name_lock(name));
    return stop_locked(name, std::chrono::milliseconds(ctx_.settings.stop_grace_ms));
}

StopOutcome LifecycleController::stop_locked(const std::string& name, std::chrono::milliseconds grace) {
    LifecycleState st = state(name);
    if (st != LifecycleState::running && st != LifecycleState::crashed) {
        throw HubError(ErrorKind::invalid_transition, name,
                       std::string("cannot stop a server that is ") + lifecycle_state_name(st));
    }
    if (st == LifecycleState::running) transition(name, LifecycleState::stopping);

    auto proc = child(name);
    auto rec = ctx_.registry.find(name);

    auto finish = [&]() {
        ctx_.ports.release_owner(name);
        ctx_.registry.forget(name);
        if (ctx_.store) {
            try {
                ctx_.store->remove(name);
            } catch (const std::runtime_error& e) {
                std::cerr << "[warn] Failed to remove stored record for " << name << ": "
                          << e.what() << "\n";
            }
        }
        {
            std::lock_guard<std::mutex> lock(state_mu_);
            children_.erase(name);
        }
        transition(name, LifecycleState::stopped);
    };

    StopOutcome outcome = StopOutcome::already_exited;
    try {
        if (proc) {
            outcome = proc->terminate(grace);
        } else if (rec && rec->pid) {
            auto ps = ctx_.registry.refresh_status(name);
            if (ps == ProcessStatus::running) {
                outcome = terminate_pid(*rec->pid, grace);
            } else if (ps == ProcessStatus::unknown) {
                std::cerr << "[warn] pid " << *rec->pid << " no longer runs " << name
                          << ", not signalling it\n";
            }
        }
    } catch (...) {
        finish();
        throw;
    }
    finish();

    std::cerr << "[lifecycle:" << name << "] Stopped (" << stop_outcome_name(outcome) << ")\n";
    return outcome;
}

ServerProcessRecord LifecycleController::restart(const std::string& name, const StartOptions& opts) {
    std::lock_guard<std::mutex> lock(name_lock(name));
    config_.server(name);
    LifecycleState st = state(name);
    if (st == LifecycleState::running || st == LifecycleState::crashed) {
        stop_locked(name, std::chrono::milliseconds(ctx_.settings.stop_grace_ms));
    }
    return start_locked(name, opts);
}

void LifecycleController::install(const std::string& name) {
    std::lock_guard<std::mutex> lock(name_lock(name));
    const McpServerConfig& cfg = config_.server(name);
    if (cfg.setup_script.empty()) {
        std::cerr << "[setup:" << name << "] No setup script configured\n";
        return;
    }
    auto setup = resolve_launch(cfg, name, lookup_, false);
    run_setup_checked(name, cfg.setup_script, setup.cwd, setup.env, ctx_.settings.setup_timeout_s);
}

StopOutcome LifecycleController::kill_pid(int pid, bool force) {
    auto name = ctx_.registry.name_for_pid(pid);
    if (!name) {
        throw HubError(ErrorKind::server_not_found, "",
                       "no recorded server with pid " + std::to_string(pid));
    }
    std::lock_guard<std::mutex> lock(name_lock(*name));
    auto grace = force ? std::chrono::milliseconds(0)
                       : std::chrono::milliseconds(ctx_.settings.stop_grace_ms);
    return stop_locked(*name, grace);
}

void LifecycleController::stop_owned() {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(state_mu_);
        for (auto& [n, _] : children_) names.push_back(n);
    }
    for (auto& n : names) {
        try {
            stop(n);
        } catch (const std::exception& e) {
            std::cerr << "[error] Failed to stop " << n << ": " << e.what() << "\n";
        }
    }
}

std::optional<int> LifecycleController::wait_for_exit(const std::string& name,
                                                      const std::atomic<bool>& interrupted) {
    auto proc = child(name);
    while (!interrupted) {
        if (proc) {
            if (!proc->running()) {
                mark_crashed(name);
                return proc->exit_code().value_or(-1);
            }
        } else if (ctx_.registry.refresh_status(name) != ProcessStatus::running) {
            mark_crashed(name);
            return -1;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    return std::nullopt;
}

// ── Status ──

ServerStatus LifecycleController::status(const std::string& name) {
    ServerStatus s;
    s.name = name;
    s.configured = config_.has_server(name);
    if (!s.configured && !ctx_.registry.find(name)) {
        throw HubError(ErrorKind::server_not_found, name, "no such server: " + name);
    }

    auto ps = ctx_.registry.refresh_status(name);
    s.state = state(name);
    if (s.state == LifecycleState::running && ps != ProcessStatus::running) {
        mark_crashed(name);
        s.state = state(name);
    }
    s.status = ps;

    if (auto rec = ctx_.registry.find(name)) {
        s.pid = rec->pid;
        s.ports = rec->ports;
        s.listening_ports = rec->listening_ports;
        s.started_at = rec->started_at;
        s.command = join_args(rec->command, rec->args);
        s.warnings = rec->warnings;
        if (ps == ProcessStatus::running && rec->started_at > 0) {
            s.uptime = format_uptime(epoch_now() - rec->started_at);
        }
    } else if (s.configured) {
        auto& cfg = config_.server(name);
        s.command = join_args(cfg.launch_command(), cfg.launch_args());
    }
    return s;
}

HubOverview LifecycleController::list_all() {
    HubOverview out;
    std::vector<std::string> names;
    for (auto& [n, _] : config_.mcp_servers) names.push_back(n);
    for (auto& n : ctx_.registry.names()) {
        if (!config_.has_server(n)) names.push_back(n);
    }
    for (auto& n : names) out.servers.push_back(status(n));

    DiscoveryScanner scanner(config_, &ctx_.registry, lookup_);
    auto report = scanner.scan();
    out.not_found = report.configured_not_found;
    out.unconfigured = report.unconfigured;
    return out;
}

} // namespace mcphub
