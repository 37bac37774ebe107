/**
 * @file main.cpp
 * @brief Entry point for the boxlink server
 *
 * Usage:
 *   boxlink_server [OPTIONS]
 *
 * Options:
 *   --port <port>           Port to listen on (default: 8080)
 *   --api-base-url <url>    Public API root used in generated base URLs
 *   --storage-dir <path>    Image directory (default: ./images)
 *   --db-path <path>        Database path (default: ./boxlink.db)
 *   --log-level <level>     Log level (default: info)
 *   --poll-interval <ms>    Worker idle interval (default: 5000)
 *   --workers <n>           Delivery threads (default: 4)
 *   --help                  Show help message
 */

#include "config.hpp"
#include "server_app.hpp"

#include <atomic>
#include <csignal>
#include <iostream>

namespace {

/// Global pointer to server app for signal handling
std::atomic<boxlink::app::boxlink_server_app*> g_server{nullptr};

/// Signal handler for graceful shutdown
void signal_handler(int /*signal*/) {
    auto* server = g_server.load();
    if (server) {
        server->request_shutdown();
    }
}

/// Install signal handlers
void install_signal_handlers() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
#ifndef _WIN32
    std::signal(SIGHUP, signal_handler);
#endif
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config = boxlink::app::boxlink_server_config::parse_args(argc, argv);
    if (!config) {
        return 1;
    }

    install_signal_handlers();

    boxlink::app::boxlink_server_app server(config.value());
    g_server = &server;

    if (!server.initialize()) {
        std::cerr << "Failed to initialize boxlink server\n";
        g_server = nullptr;
        return 1;
    }

    if (!server.start()) {
        std::cerr << "Failed to start boxlink server\n";
        g_server = nullptr;
        return 1;
    }

    std::cout << "boxlink server running on port " << config->server.port
              << " (Ctrl+C to stop)\n";

    server.wait_for_shutdown();
    server.print_statistics();

    g_server = nullptr;

    std::cout << "boxlink server terminated\n";
    return 0;
}
