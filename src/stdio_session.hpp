#pragma once
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <thread>
#include <atomic>
#include <future>
#include <chrono>
#include <optional>
#include <functional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace mcphub {

struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json parameter_schema;

    nlohmann::json to_json() const;
};

struct ToolResult {
    nlohmann::json content = nlohmann::json::array();
    bool is_error = false;
    nlohmann::json structured;   // structuredContent, null when absent

    // Text items joined by newlines
    std::string text() const;
    nlohmann::json to_json() const;
    static ToolResult from_json(const nlohmann::json& result);
};

struct ToolCacheEntry {
    std::string server_name;
    std::vector<ToolDescriptor> tools;
    int64_t fetched_at = 0;
};

struct RequestHandle {
    int64_t id = 0;
    std::string method;
    std::shared_future<nlohmann::json> result;
};

// Newline-delimited JSON-RPC 2.0 over a child's stdin/stdout.
//
// A background reader routes every response to the pending request with the same
// id; each pending request is resolved exactly once, by whichever of response,
// timeout, cancel or transport close gets to it first. Callers only ever block on
// their own request.
class StdioSession {
public:
    // Takes ownership of both descriptors.
    StdioSession(std::string server, int stdin_fd, int stdout_fd,
                 std::chrono::milliseconds default_timeout = std::chrono::milliseconds(30000));
    ~StdioSession();

    StdioSession(const StdioSession&) = delete;
    StdioSession& operator=(const StdioSession&) = delete;

    // Starts the reader and performs the initialize handshake.
    void open();
    void close();
    bool closed() const { return closed_; }

    RequestHandle submit(const std::string& method, const nlohmann::json& params = nullptr);
    nlohmann::json await(const RequestHandle& h,
                         std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    nlohmann::json request(const std::string& method, const nlohmann::json& params = nullptr,
                           std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    void notify(const std::string& method, const nlohmann::json& params = nullptr);

    // Fails the waiter with Cancelled. The server is not told.
    bool cancel(int64_t id);

    // `timeout` applies to each tools/list page.
    std::vector<ToolDescriptor> list_tools(bool use_cache = true,
                                           std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    ToolResult call_tool(const std::string& tool, const nlohmann::json& arguments,
                         std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    void invalidate_cache();
    std::optional<ToolCacheEntry> cached_tools() const;

    const std::string& server() const { return server_; }
    nlohmann::json server_info() const;
    size_t requests_sent() const { return requests_sent_; }
    size_t pending_count() const;

    // Attached to TransportClosed errors for diagnostics.
    void set_stderr_source(std::function<std::string()> fn) { stderr_source_ = std::move(fn); }
    // Runs on the reader thread when the server closes its stdout. Must not
    // destroy the session.
    void set_on_closed(std::function<void()> fn) { on_closed_ = std::move(fn); }

private:
    struct PendingRequest {
        int64_t id = 0;
        std::string method;
        std::chrono::steady_clock::time_point submitted_at;
        std::promise<nlohmann::json> slot;
    };

    void reader_loop();
    void handle_line(const std::string& line);
    void handle_server_request(const nlohmann::json& msg);
    void handle_notification(const nlohmann::json& msg);
    void write_line(const std::string& line);
    void fail_all(const std::string& reason);
    // Removes the pending entry; empty if already resolved.
    std::optional<PendingRequest> take_pending(int64_t id);
    std::string stderr_tail() const;

    std::string server_;
    int stdin_fd_;
    int stdout_fd_;
    int wake_fds_[2] = {-1, -1};
    std::chrono::milliseconds default_timeout_;

    std::thread reader_;
    std::atomic<bool> closed_{false};
    std::atomic<bool> closing_{false};
    std::atomic<int64_t> next_id_{1};
    std::atomic<size_t> requests_sent_{0};

    mutable std::mutex pending_mu_;
    std::map<int64_t, PendingRequest> pending_;

    std::mutex write_mu_;

    mutable std::mutex cache_mu_;
    std::mutex fetch_mu_;
    std::optional<ToolCacheEntry> cache_;

    mutable std::mutex info_mu_;
    nlohmann::json server_info_;

    std::function<std::string()> stderr_source_;
    std::function<void()> on_closed_;
};

} // namespace mcphub
