#include "stdio_session.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <iostream>
#include <cstring>
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace mcphub {

static constexpr const char* PROTOCOL_VERSION = "2025-06-18";
static constexpr int METHOD_NOT_FOUND = -32601;

// ── Tool types ──

nlohmann::json ToolDescriptor::to_json() const {
    return {
        {"name", name},
        {"description", description},
        {"parameter_schema", parameter_schema}
    };
}

std::string ToolResult::text() const {
    std::string output;
    if (!content.is_array()) return output;
    for (auto& item : content) {
        if (item.value("type", "") == "text") {
            if (!output.empty()) output += "\n";
            output += item.value("text", "");
        }
    }
    return output;
}

nlohmann::json ToolResult::to_json() const {
    nlohmann::json j = {{"content", content}, {"is_error", is_error}};
    if (!structured.is_null()) j["structured"] = structured;
    return j;
}

ToolResult ToolResult::from_json(const nlohmann::json& result) {
    ToolResult r;
    if (!result.is_object()) return r;
    if (result.contains("content") && result["content"].is_array()) {
        r.content = result["content"];
    }
    r.is_error = result.value("isError", false);
    if (result.contains("structuredContent")) r.structured = result["structuredContent"];
    return r;
}

// ── Session ──

StdioSession::StdioSession(std::string server, int stdin_fd, int stdout_fd,
                           std::chrono::milliseconds default_timeout)
    : server_(std::move(server)), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd),
      default_timeout_(default_timeout) {}

StdioSession::~StdioSession() {
    close();
}

void StdioSession::open() {
    if (stdin_fd_ < 0 || stdout_fd_ < 0) {
        throw HubError(ErrorKind::transport_closed, server_, "no stdio pipes to attach to");
    }
    if (::pipe2(wake_fds_, O_CLOEXEC) != 0) {
        throw HubError(ErrorKind::transport_closed, server_,
                       std::string("failed to create wake pipe: ") + std::strerror(errno));
    }
    reader_ = std::thread(&StdioSession::reader_loop, this);

    auto result = request("initialize", {
        {"protocolVersion", PROTOCOL_VERSION},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", "mcphub"}, {"version", "1.0"}}}
    });
    {
        std::lock_guard<std::mutex> lock(info_mu_);
        server_info_ = result.value("serverInfo", nlohmann::json::object());
    }
    notify("notifications/initialized");
    std::cerr << "[mcp:" << server_ << "] Initialized ("
              << result.value("protocolVersion", std::string("?")) << ")\n";
}

void StdioSession::close() {
    closing_ = true;
    if (wake_fds_[1] >= 0) {
        char c = 'x';
        ssize_t w = ::write(wake_fds_[1], &c, 1);
        (void)w;
    }
    if (reader_.joinable()) reader_.join();

    closed_ = true;
    fail_all("session closed");

    {
        std::lock_guard<std::mutex> lock(write_mu_);
        if (stdin_fd_ >= 0) {
            ::close(stdin_fd_);
            stdin_fd_ = -1;
        }
    }
    for (int* fd : {&stdout_fd_, &wake_fds_[0], &wake_fds_[1]}) {
        if (*fd >= 0) {
            ::close(*fd);
            *fd = -1;
        }
    }
}

std::string StdioSession::stderr_tail() const {
    return stderr_source_ ? stderr_source_() : std::string();
}

nlohmann::json StdioSession::server_info() const {
    std::lock_guard<std::mutex> lock(info_mu_);
    return server_info_;
}

size_t StdioSession::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mu_);
    return pending_.size();
}

void StdioSession::write_line(const std::string& json_str) {
    std::string line = json_str + "\n";
    std::lock_guard<std::mutex> lock(write_mu_);
    if (stdin_fd_ < 0) {
        throw HubError(ErrorKind::transport_closed, server_, "stdin is closed");
    }
    size_t total = 0;
    while (total < line.size()) {
        ssize_t n = ::write(stdin_fd_, line.c_str() + total, line.size() - total);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            throw HubError(ErrorKind::transport_closed, server_,
                           std::string("write failed: ") + std::strerror(errno), stderr_tail());
        }
        total += static_cast<size_t>(n);
    }
}

RequestHandle StdioSession::submit(const std::string& method, const nlohmann::json& params) {
    int64_t id = next_id_++;
    nlohmann::json req = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method}
    };
    if (!params.is_null()) {
        req["params"] = params;
    }

    RequestHandle handle;
    handle.id = id;
    handle.method = method;
    {
        // closed_ is set before fail_all() takes this lock, so an entry added
        // here is either failed by the reader or never added.
        std::lock_guard<std::mutex> lock(pending_mu_);
        if (closed_) {
            throw HubError(ErrorKind::transport_closed, server_, "session is closed", stderr_tail());
        }
        PendingRequest p;
        p.id = id;
        p.method = method;
        p.submitted_at = std::chrono::steady_clock::now();
        handle.result = p.slot.get_future().share();
        pending_.emplace(id, std::move(p));
    }

    try {
        write_line(req.dump());
    } catch (const HubError&) {
        take_pending(id);
        throw;
    }
    requests_sent_++;
    return handle;
}

std::optional<StdioSession::PendingRequest> StdioSession::take_pending(int64_t id) {
    std::lock_guard<std::mutex> lock(pending_mu_);
    auto it = pending_.find(id);
    if (it == pending_.end()) return std::nullopt;
    PendingRequest p = std::move(it->second);
    pending_.erase(it);
    return p;
}

nlohmann::json StdioSession::await(const RequestHandle& h,
                                   std::optional<std::chrono::milliseconds> timeout) {
    auto limit = timeout.value_or(default_timeout_);
    if (h.result.wait_for(limit) != std::future_status::ready) {
        // Only the side that removes the entry may resolve it; if the reader got
        // there first the result is already in the slot.
        if (auto p = take_pending(h.id)) {
            std::cerr << "[mcp:" << server_ << "] " << h.method << " (id " << h.id
                      << ") timed out after " << limit.count() << "ms\n";
            throw HubError(ErrorKind::request_timeout, server_,
                           h.method + " timed out after " + std::to_string(limit.count()) + "ms");
        }
    }
    return h.result.get();
}

nlohmann::json StdioSession::request(const std::string& method, const nlohmann::json& params,
                                     std::optional<std::chrono::milliseconds> timeout) {
    return await(submit(method, params), timeout);
}

void StdioSession::notify(const std::string& method, const nlohmann::json& params) {
    nlohmann::json notif = {
        {"jsonrpc", "2.0"},
        {"method", method}
    };
    if (!params.is_null()) {
        notif["params"] = params;
    }
    write_line(notif.dump());
}

bool StdioSession::cancel(int64_t id) {
    auto p = take_pending(id);
    if (!p) return false;
    p->slot.set_exception(std::make_exception_ptr(
        HubError(ErrorKind::cancelled, server_, p->method + " (id " + std::to_string(id) + ") was cancelled")));
    return true;
}

void StdioSession::fail_all(const std::string& reason) {
    std::map<int64_t, PendingRequest> failed;
    {
        std::lock_guard<std::mutex> lock(pending_mu_);
        failed.swap(pending_);
    }
    if (failed.empty()) return;
    std::string tail = stderr_tail();
    for (auto& [id, p] : failed) {
        p.slot.set_exception(std::make_exception_ptr(
            HubError(ErrorKind::transport_closed, server_,
                     p.method + " (id " + std::to_string(id) + "): " + reason, tail)));
    }
}

// ── Reader ──

void StdioSession::reader_loop() {
    std::string buf;
    char chunk[8192];

    while (!closing_) {
        pollfd fds[2] = {
            {stdout_fd_, POLLIN, 0},
            {wake_fds_[0], POLLIN, 0},
        };
        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[mcp:" << server_ << "] poll failed: " << std::strerror(errno) << "\n";
            break;
        }
        if (fds[1].revents) break;  // close() requested
        if (!fds[0].revents) continue;

        ssize_t n = ::read(stdout_fd_, chunk, sizeof(chunk));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;  // EOF: the server exited or closed stdout

        buf.append(chunk, static_cast<size_t>(n));
        size_t pos;
        while ((pos = buf.find('\n')) != std::string::npos) {
            std::string line = buf.substr(0, pos);
            buf.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) continue;
            handle_line(line);
        }
    }

    if (closing_) return;

    // Reject new submissions before failing the in-flight ones so nothing can
    // slip in between.
    closed_ = true;
    std::cerr << "[mcp:" << server_ << "] Transport closed\n";
    fail_all("server closed its stdout");
    if (on_closed_) on_closed_();
}

void StdioSession::handle_line(const std::string& line) {
    nlohmann::json msg;
    try {
        msg = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error&) {
        std::cerr << "[mcp:" << server_ << "] Protocol error, discarding malformed line: "
                  << truncate(line, 200) << "\n";
        return;
    }
    if (!msg.is_object()) {
        std::cerr << "[mcp:" << server_ << "] Protocol error, discarding non-object message: "
                  << truncate(line, 200) << "\n";
        return;
    }

    if (msg.contains("method")) {
        if (msg.contains("id")) handle_server_request(msg);
        else handle_notification(msg);
        return;
    }

    if (!msg.contains("id") || !msg["id"].is_number_integer()) {
        std::cerr << "[mcp:" << server_ << "] Protocol error, response without usable id: "
                  << truncate(line, 200) << "\n";
        return;
    }

    int64_t id = msg["id"].get<int64_t>();
    auto p = take_pending(id);
    if (!p) {
        std::cerr << "[mcp:" << server_ << "] Discarding response for unknown id " << id << "\n";
        return;
    }

    if (msg.contains("error")) {
        auto& err = msg["error"];
        int code = err.is_object() ? err.value("code", 0) : 0;
        std::string message = err.is_object() ? err.value("message", err.dump()) : err.dump();
        p->slot.set_exception(std::make_exception_ptr(
            HubError(ErrorKind::remote_error, server_,
                     p->method + " failed: [" + std::to_string(code) + "] " + message)));
    } else if (msg.contains("result")) {
        p->slot.set_value(msg["result"]);
    } else {
        p->slot.set_exception(std::make_exception_ptr(
            HubError(ErrorKind::protocol_error, server_,
                     p->method + ": response has neither result nor error")));
    }
}

void StdioSession::handle_server_request(const nlohmann::json& msg) {
    std::string method = msg.value("method", "");
    nlohmann::json reply = {{"jsonrpc", "2.0"}, {"id", msg["id"]}};
    if (method == "ping") {
        reply["result"] = nlohmann::json::object();
    } else {
        reply["error"] = {{"code", METHOD_NOT_FOUND}, {"message", "Method not found: " + method}};
    }
    try {
        write_line(reply.dump());
    } catch (const HubError& e) {
        std::cerr << "[mcp:" << server_ << "] Failed to answer " << method << ": " << e.what() << "\n";
    }
}

void StdioSession::handle_notification(const nlohmann::json& msg) {
    std::string method = msg.value("method", "");
    if (method == "notifications/tools/list_changed") {
        std::cerr << "[mcp:" << server_ << "] Tool list changed\n";
        invalidate_cache();
    } else if (method == "notifications/message") {
        auto params = msg.value("params", nlohmann::json::object());
        std::cerr << "[mcp:" << server_ << "] " << params.value("level", std::string("info"))
                  << ": " << params.value("data", nlohmann::json()).dump() << "\n";
    }
}

// ── Tools ──

std::vector<ToolDescriptor> StdioSession::list_tools(bool use_cache,
                                                     std::optional<std::chrono::milliseconds> timeout) {
    std::lock_guard<std::mutex> fetch_lock(fetch_mu_);
    if (use_cache) {
        std::lock_guard<std::mutex> lock(cache_mu_);
        if (cache_) return cache_->tools;
    }

    std::vector<ToolDescriptor> tools;
    nlohmann::json cursor;
    do {
        nlohmann::json params = nlohmann::json::object();
        if (!cursor.is_null()) params["cursor"] = cursor;
        auto result = request("tools/list", params, timeout);
        if (!result.contains("tools") || !result["tools"].is_array()) {
            throw HubError(ErrorKind::protocol_error, server_, "tools/list result has no tools array");
        }
        for (auto& t : result["tools"]) {
            ToolDescriptor td;
            td.name = t.value("name", "");
            td.description = t.value("description", "");
            if (t.contains("inputSchema")) {
                td.parameter_schema = t["inputSchema"];
            } else {
                td.parameter_schema = {{"type", "object"}, {"properties", nlohmann::json::object()}};
            }
            tools.push_back(std::move(td));
        }
        cursor = result.contains("nextCursor") ? result["nextCursor"] : nlohmann::json();
    } while (cursor.is_string() && !cursor.get<std::string>().empty());

    std::lock_guard<std::mutex> lock(cache_mu_);
    cache_ = ToolCacheEntry{server_, tools, epoch_now()};
    return tools;
}

ToolResult StdioSession::call_tool(const std::string& tool, const nlohmann::json& arguments,
                                   std::optional<std::chrono::milliseconds> timeout) {
    auto args = arguments.is_null() ? nlohmann::json::object() : arguments;
    auto result = request("tools/call", {{"name", tool}, {"arguments", args}}, timeout);
    return ToolResult::from_json(result);
}

void StdioSession::invalidate_cache() {
    std::lock_guard<std::mutex> lock(cache_mu_);
    cache_.reset();
}

std::optional<ToolCacheEntry> StdioSession::cached_tools() const {
    std::lock_guard<std::mutex> lock(cache_mu_);
    return cache_;
}

} // namespace mcphub
