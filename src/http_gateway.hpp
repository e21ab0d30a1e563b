#pragma once
#include "hub.hpp"
#include "errors.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <thread>
#include <chrono>
#include <optional>
#include <iostream>

namespace mcphub {

// Status and tool surfaces over HTTP, for framework adapters that cannot
// speak stdio themselves.
class HttpGateway {
public:
    HttpGateway(Hub& hub, const std::string& host, int port)
        : hub_(hub), host_(host), port_(port) {}

    ~HttpGateway() { stop(); }

    // Binds synchronously and serves on a background thread. False when the
    // address cannot be bound. Port 0 picks a free port, see port().
    bool start() {
        server_.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"status":"ok"})", "application/json");
        });

        server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                         std::exception_ptr ep) {
            nlohmann::json err;
            res.status = 500;
            try {
                if (ep) std::rethrow_exception(ep);
                err["error"] = "unknown error";
            } catch (const HubError& e) {
                res.status = http_status_for(e.kind());
                err["error"] = e.what();
                err["kind"] = error_kind_name(e.kind());
                err["server"] = e.server();
                err["output"] = e.output();
            } catch (const std::exception& e) {
                err["error"] = e.what();
            }
            std::cerr << "[http] " << req.method << " " << req.path << " -> " << res.status
                      << ": " << err.value("error", std::string()) << "\n";
            res.set_content(err.dump(), "application/json");
        });

        server_.Get("/servers", [this](const httplib::Request&, httplib::Response& res) {
            json_reply(res, hub_.list_all().to_json());
        });

        server_.Get(R"(/servers/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
            json_reply(res, hub_.status(req.matches[1]).to_json());
        });

        server_.Post(R"(/servers/([^/]+)/start)", [this](const httplib::Request& req, httplib::Response& res) {
            std::string name = req.matches[1];
            hub_.start(name);
            json_reply(res, hub_.status(name).to_json());
        });

        server_.Post(R"(/servers/([^/]+)/stop)", [this](const httplib::Request& req, httplib::Response& res) {
            std::string name = req.matches[1];
            auto outcome = hub_.stop(name);
            json_reply(res, {{"name", name}, {"outcome", stop_outcome_name(outcome)}});
        });

        server_.Post(R"(/servers/([^/]+)/restart)", [this](const httplib::Request& req, httplib::Response& res) {
            std::string name = req.matches[1];
            hub_.restart(name);
            json_reply(res, hub_.status(name).to_json());
        });

        server_.Get(R"(/servers/([^/]+)/tools)", [this](const httplib::Request& req, httplib::Response& res) {
            std::optional<bool> use_cache;
            if (req.has_param("cache")) use_cache = req.get_param_value("cache") != "0";
            std::optional<std::chrono::milliseconds> timeout;
            if (!timeout_param(req, res, timeout)) return;
            nlohmann::json arr = nlohmann::json::array();
            for (auto& t : hub_.list_tools(req.matches[1], use_cache, timeout)) {
                arr.push_back(t.to_json());
            }
            json_reply(res, {{"tools", arr}});
        });

        server_.Post(R"(/servers/([^/]+)/tools/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
            std::optional<std::chrono::milliseconds> timeout;
            if (!timeout_param(req, res, timeout)) return;
            nlohmann::json args = nlohmann::json::object();
            if (!req.body.empty()) {
                try {
                    args = nlohmann::json::parse(req.body);
                } catch (const nlohmann::json::parse_error&) {
                    res.status = 400;
                    res.set_content(R"({"error":"invalid JSON in request body"})", "application/json");
                    return;
                }
            }
            json_reply(res, hub_.call_tool(req.matches[1], req.matches[2], args, timeout).to_json());
        });

        if (port_ == 0) {
            int bound = server_.bind_to_any_port(host_);
            if (bound < 0) {
                std::cerr << "[error] Cannot bind " << host_ << "\n";
                return false;
            }
            port_ = bound;
        } else if (!server_.bind_to_port(host_, port_)) {
            std::cerr << "[error] Cannot listen on " << host_ << ":" << port_ << "\n";
            return false;
        }

        std::cerr << "[http] Listening on " << host_ << ":" << port_ << "\n";
        thread_ = std::thread([this]() {
            if (!server_.listen_after_bind()) {
                std::cerr << "[error] HTTP gateway on port " << port_ << " stopped unexpectedly\n";
            }
        });
        return true;
    }

    int port() const { return port_; }

    void stop() {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

private:
    Hub& hub_;
    std::string host_;
    int port_;
    httplib::Server server_;
    std::thread thread_;

    // ?timeout_ms=N overrides hub.request_timeout_ms for one call. False
    // (with a 400 reply) when N is not a positive integer.
    static bool timeout_param(const httplib::Request& req, httplib::Response& res,
                              std::optional<std::chrono::milliseconds>& timeout) {
        if (!req.has_param("timeout_ms")) return true;
        std::string v = req.get_param_value("timeout_ms");
        if (v.empty() || v.size() > 9 || v.find_first_not_of("0123456789") != std::string::npos ||
            std::stol(v) == 0) {
            res.status = 400;
            res.set_content(R"({"error":"timeout_ms must be a positive integer"})", "application/json");
            return false;
        }
        timeout = std::chrono::milliseconds(std::stol(v));
        return true;
    }

    static void json_reply(httplib::Response& res, const nlohmann::json& body) {
        res.set_content(body.dump(), "application/json");
    }
};

} // namespace mcphub
