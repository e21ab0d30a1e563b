#include "gateway.hpp"
#include "config.hpp"
#include "hub.hpp"
#include "http_gateway.hpp"
#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>

namespace mcphub {

static std::atomic<bool> g_running{true};

static void signal_handler(int) {
    g_running = false;
}

int cmd_serve(const std::string& host, int port) {
    Config cfg = Config::load(default_config_path());
    if (cfg.mcp_servers.empty()) {
        std::cerr << "[warn] No MCP servers configured. Gateway will still run.\n";
    }

    Hub hub(cfg);
    HttpGateway http(hub, host, port);
    if (!http.start()) {
        hub.shutdown();
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cerr << "[hub] Ready. Ctrl+C to quit.\n";
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[hub] Shutting down...\n";
    http.stop();
    hub.shutdown();
    std::cerr << "[hub] Done.\n";
    return 0;
}

} // namespace mcphub
