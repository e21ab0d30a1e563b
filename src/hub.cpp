#include "hub.hpp"
#include "errors.hpp"
#include <iostream>
#include <unistd.h>

namespace mcphub {

Hub::Hub(Config cfg, bool persist, EnvLookup lookup)
    : config_(std::move(cfg)), ctx_(config_.hub, persist),
      lifecycle_(config_, ctx_, std::move(lookup)) {}

Hub::~Hub() {
    shutdown();
}

void Hub::shutdown() {
    std::map<std::string, std::shared_ptr<StdioSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mu_);
        sessions.swap(sessions_);
    }
    for (auto& [name, session] : sessions) {
        session->close();
        std::cerr << "[hub] Disconnected from " << name << "\n";
    }
    lifecycle_.stop_owned();
}

std::shared_ptr<StdioSession> Hub::attach(const std::string& name) {
    auto child = lifecycle_.child(name);
    if (!child) {
        throw HubError(ErrorKind::transport_closed, name,
                       "server was started by another mcphub process; its stdio is not reachable from here");
    }
    int in = child->take_stdin();
    int out = child->take_stdout();
    if (in < 0 || out < 0) {
        if (in >= 0) ::close(in);
        if (out >= 0) ::close(out);
        throw HubError(ErrorKind::transport_closed, name, "server stdio is not piped to the hub");
    }

    auto session = std::make_shared<StdioSession>(
        name, in, out, std::chrono::milliseconds(ctx_.settings.request_timeout_ms));
    session->set_stderr_source([child]() { return child->stderr_tail(); });
    session->set_on_closed([this, name]() { lifecycle_.mark_crashed(name); });

    try {
        session->open();
    } catch (const HubError& e) {
        std::cerr << "[hub] Handshake with " << name << " failed: " << e.what() << "\n";
        session->close();
        lifecycle_.stop(name);
        throw;
    }

    std::lock_guard<std::mutex> lock(sessions_mu_);
    sessions_[name] = session;
    std::cerr << "[hub] Connected to " << name << "\n";
    return session;
}

void Hub::detach(const std::string& name) {
    std::shared_ptr<StdioSession> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mu_);
        auto it = sessions_.find(name);
        if (it == sessions_.end()) return;
        session = it->second;
        sessions_.erase(it);
    }
    session->close();
}

std::mutex& Hub::attach_lock(const std::string& name) {
    std::lock_guard<std::mutex> lock(attach_locks_mu_);
    auto& m = attach_locks_[name];
    if (!m) m = std::make_unique<std::mutex>();
    return *m;
}

std::shared_ptr<StdioSession> Hub::session_for(const std::string& name) {
    config_.server(name);
    {
        std::lock_guard<std::mutex> lock(sessions_mu_);
        auto it = sessions_.find(name);
        if (it != sessions_.end() && !it->second->closed()) return it->second;
    }

    std::lock_guard<std::mutex> attach_guard(attach_lock(name));
    {
        std::lock_guard<std::mutex> lock(sessions_mu_);
        auto it = sessions_.find(name);
        if (it != sessions_.end()) {
            if (!it->second->closed()) return it->second;
            sessions_.erase(it);
        }
    }

    auto st = lifecycle_.status(name);
    if (st.state == LifecycleState::running && !lifecycle_.child(name)) {
        throw HubError(ErrorKind::transport_closed, name,
                       "server was started by another mcphub process; stop it or call tools from there");
    }
    if (st.state != LifecycleState::running) {
        std::cerr << "[hub] Starting " << name << " on demand\n";
    }
    lifecycle_.start(name);
    return attach(name);
}

ServerProcessRecord Hub::start(const std::string& name, const StartOptions& opts) {
    StartOptions o = opts;
    // supergateway owns the server's stdio; nothing for the hub to attach to
    if (o.sse) o.stdio = StdioMode::inherit;

    std::lock_guard<std::mutex> attach_guard(attach_lock(name));
    auto rec = lifecycle_.start(name, o);
    if (o.stdio == StdioMode::pipe) {
        bool attached;
        {
            std::lock_guard<std::mutex> lock(sessions_mu_);
            auto it = sessions_.find(name);
            attached = it != sessions_.end() && !it->second->closed();
        }
        if (!attached && lifecycle_.child(name)) attach(name);
    }
    return rec;
}

StopOutcome Hub::stop(const std::string& name) {
    std::lock_guard<std::mutex> attach_guard(attach_lock(name));
    // Signal first so the outcome reflects SIGTERM, not the server noticing EOF
    StopOutcome outcome;
    try {
        outcome = lifecycle_.stop(name);
    } catch (...) {
        detach(name);
        throw;
    }
    detach(name);
    return outcome;
}

ServerProcessRecord Hub::restart(const std::string& name, const StartOptions& opts) {
    StartOptions o = opts;
    if (o.sse) o.stdio = StdioMode::inherit;

    std::lock_guard<std::mutex> attach_guard(attach_lock(name));
    detach(name);
    auto rec = lifecycle_.restart(name, o);
    if (o.stdio == StdioMode::pipe && lifecycle_.child(name)) attach(name);
    return rec;
}

void Hub::install(const std::string& name) {
    lifecycle_.install(name);
}

ServerStatus Hub::status(const std::string& name) {
    return lifecycle_.status(name);
}

HubOverview Hub::list_all() {
    return lifecycle_.list_all();
}

DiscoveryReport Hub::scan() {
    DiscoveryScanner scanner(config_, &ctx_.registry, lifecycle_.lookup());
    return scanner.scan();
}

std::vector<ToolDescriptor> Hub::list_tools(const std::string& name, std::optional<bool> use_cache,
                                            std::optional<std::chrono::milliseconds> timeout) {
    return session_for(name)->list_tools(use_cache.value_or(ctx_.settings.cache_tools), timeout);
}

ToolResult Hub::call_tool(const std::string& name, const std::string& tool,
                          const nlohmann::json& arguments,
                          std::optional<std::chrono::milliseconds> timeout) {
    return session_for(name)->call_tool(tool, arguments, timeout);
}

void Hub::invalidate_tools(const std::string& name) {
    std::lock_guard<std::mutex> lock(sessions_mu_);
    auto it = sessions_.find(name);
    if (it != sessions_.end()) it->second->invalidate_cache();
}

} // namespace mcphub
