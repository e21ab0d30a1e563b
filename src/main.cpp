#include <iostream>
#include <string>
#include <vector>
#include "commands.hpp"
#include "gateway.hpp"
#include "errors.hpp"

static void print_usage() {
    std::cout << "Usage: mcphub <command> [options]\n\n"
              << "Commands:\n"
              << "  init                        Create .mcphub.json in the current directory\n"
              << "  list                        List configured servers\n"
              << "  remove NAME                 Remove a server from the config\n"
              << "  install NAME                Run the server's setup script\n"
              << "  run NAME [--sse] [--port P] [--base-url URL]\n"
              << "        [--sse-path PATH] [--message-path PATH]\n"
              << "                              Run a server in the foreground\n"
              << "  stop NAME                   Stop a running server\n"
              << "  restart NAME [run options]  Stop, then run in the foreground\n"
              << "  kill PID [-f]               Stop the recorded server with this pid\n"
              << "  ps                          List running servers\n"
              << "  status NAME                 Detailed status of one server\n"
              << "  scan                        Find configured and unconfigured MCP processes\n"
              << "  tools NAME [--no-cache]     List a server's tools\n"
              << "  call NAME TOOL [JSON]       Call a tool with JSON arguments\n"
              << "  serve [--host H] [--port P] Start the HTTP gateway\n";
}

static bool need(const std::vector<std::string>& args, size_t n, const char* what) {
    if (args.size() >= n) return true;
    std::cerr << "Missing argument: " << what << "\n";
    print_usage();
    return false;
}

static mcphub::StartOptions parse_run_options(const std::vector<std::string>& args) {
    mcphub::StartOptions opts;
    for (size_t i = 1; i < args.size(); i++) {
        if (args[i] == "--sse") {
            opts.sse = true;
        } else if (args[i] == "--port" && i + 1 < args.size()) {
            opts.port = std::stoi(args[++i]);
        } else if (args[i] == "--base-url" && i + 1 < args.size()) {
            opts.base_url = args[++i];
        } else if (args[i] == "--sse-path" && i + 1 < args.size()) {
            opts.sse_path = args[++i];
        } else if (args[i] == "--message-path" && i + 1 < args.size()) {
            opts.message_path = args[++i];
        } else {
            std::cerr << "[warn] Ignoring unknown option: " << args[i] << "\n";
        }
    }
    return opts;
}

static int dispatch(const std::string& cmd, const std::vector<std::string>& args) {
    if (cmd == "init") {
        return mcphub::cmd_init();
    }
    else if (cmd == "list") {
        return mcphub::cmd_list();
    }
    else if (cmd == "remove") {
        if (!need(args, 1, "NAME")) return 1;
        return mcphub::cmd_remove(args[0]);
    }
    else if (cmd == "install") {
        if (!need(args, 1, "NAME")) return 1;
        return mcphub::cmd_install(args[0]);
    }
    else if (cmd == "run" || cmd == "restart") {
        if (!need(args, 1, "NAME")) return 1;
        return mcphub::cmd_run(args[0], parse_run_options(args), cmd == "restart");
    }
    else if (cmd == "stop") {
        if (!need(args, 1, "NAME")) return 1;
        return mcphub::cmd_stop(args[0]);
    }
    else if (cmd == "kill") {
        if (!need(args, 1, "PID")) return 1;
        bool force = false;
        for (size_t i = 1; i < args.size(); i++) {
            if (args[i] == "-f" || args[i] == "--force") force = true;
        }
        return mcphub::cmd_kill(std::stoi(args[0]), force);
    }
    else if (cmd == "ps") {
        return mcphub::cmd_ps();
    }
    else if (cmd == "status") {
        if (!need(args, 1, "NAME")) return 1;
        return mcphub::cmd_status(args[0]);
    }
    else if (cmd == "scan") {
        return mcphub::cmd_scan();
    }
    else if (cmd == "tools") {
        if (!need(args, 1, "NAME")) return 1;
        bool no_cache = false;
        for (size_t i = 1; i < args.size(); i++) {
            if (args[i] == "--no-cache") no_cache = true;
        }
        return mcphub::cmd_tools(args[0], no_cache);
    }
    else if (cmd == "call") {
        if (!need(args, 2, "NAME TOOL")) return 1;
        return mcphub::cmd_call(args[0], args[1], args.size() > 2 ? args[2] : "");
    }
    else if (cmd == "serve") {
        std::string host = "127.0.0.1";
        int port = 18790;
        for (size_t i = 0; i < args.size(); i++) {
            if (args[i] == "--host" && i + 1 < args.size()) {
                host = args[++i];
            } else if (args[i] == "--port" && i + 1 < args.size()) {
                port = std::stoi(args[++i]);
            }
        }
        return mcphub::cmd_serve(host, port);
    }
    else {
        std::cerr << "Unknown command: " << cmd << "\n";
        print_usage();
        return 1;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string cmd = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) {
        args.push_back(argv[i]);
    }

    try {
        return dispatch(cmd, args);
    } catch (const mcphub::HubError& e) {
        std::cerr << "[error] " << e.describe() << "\n";
        if (!e.output().empty()) {
            std::cerr << "--- output ---\n" << e.output();
            if (e.output().back() != '\n') std::cerr << "\n";
        }
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }
}
