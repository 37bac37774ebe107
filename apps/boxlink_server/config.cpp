/**
 * @file config.cpp
 * @brief Command line parsing for the boxlink server
 */

#include "config.hpp"

#include <iostream>
#include <stdexcept>
#include <string_view>

namespace boxlink::app {

void boxlink_server_config::print_help() {
    std::cout << R"(
boxlink Server - Box-to-Box Image Transfer

Usage: boxlink_server [OPTIONS]

Options:
  --port <port>           Port to listen on (default: 8080)
  --api-base-url <url>    Public API root used in generated base URLs
                          (default: http://localhost:<port>/api)
  --storage-dir <path>    Directory for stored images (default: ./images)
  --db-path <path>        SQLite database path (default: ./boxlink.db)
  --log-level <level>     Log level: trace, debug, info, warn, error, fatal
                          (default: info)
  --poll-interval <ms>    Idle interval of delivery workers (default: 5000)
  --workers <n>           Delivery thread count (default: 4)
  --help, -h              Show this help message

Examples:
  # Start with default settings
  boxlink_server

  # Advertise a public address
  boxlink_server --port 9000 --api-base-url https://boxes.example.org/api

)";
}

auto boxlink_server_config::parse_args(int argc, char* argv[])
    -> std::optional<boxlink_server_config> {

    boxlink_server_config config;
    bool base_url_given = false;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_help();
            return std::nullopt;
        }

        if (arg == "--port") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --port requires a value\n";
                return std::nullopt;
            }
            try {
                auto port = std::stoi(argv[++i]);
                if (port <= 0 || port > 65535) {
                    throw std::out_of_range("port");
                }
                config.server.port = static_cast<std::uint16_t>(port);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid port number\n";
                return std::nullopt;
            }
            continue;
        }

        if (arg == "--api-base-url") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --api-base-url requires a value\n";
                return std::nullopt;
            }
            config.server.api_base_url = argv[++i];
            while (!config.server.api_base_url.empty() &&
                   config.server.api_base_url.back() == '/') {
                config.server.api_base_url.pop_back();
            }
            base_url_given = true;
            continue;
        }

        if (arg == "--storage-dir") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --storage-dir requires a value\n";
                return std::nullopt;
            }
            config.storage.directory = argv[++i];
            continue;
        }

        if (arg == "--db-path") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --db-path requires a value\n";
                return std::nullopt;
            }
            config.database.path = argv[++i];
            continue;
        }

        if (arg == "--log-level") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --log-level requires a value\n";
                return std::nullopt;
            }
            config.logging.level = argv[++i];
            const std::string_view level = config.logging.level;
            if (level != "trace" && level != "debug" && level != "info" &&
                level != "warn" && level != "error" && level != "fatal") {
                std::cerr << "Error: Invalid log level: " << level << "\n";
                std::cerr << "Valid levels: trace, debug, info, warn, error, fatal\n";
                return std::nullopt;
            }
            continue;
        }

        if (arg == "--poll-interval") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --poll-interval requires a value\n";
                return std::nullopt;
            }
            try {
                auto ms = std::stol(argv[++i]);
                if (ms <= 0) {
                    throw std::out_of_range("poll-interval");
                }
                config.transfer.poll_interval = std::chrono::milliseconds(ms);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid poll-interval value\n";
                return std::nullopt;
            }
            continue;
        }

        if (arg == "--workers") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --workers requires a value\n";
                return std::nullopt;
            }
            try {
                auto n = std::stoi(argv[++i]);
                if (n <= 0) {
                    throw std::out_of_range("workers");
                }
                config.transfer.workers = static_cast<std::size_t>(n);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid workers value\n";
                return std::nullopt;
            }
            continue;
        }

        std::cerr << "Error: Unknown option: " << arg << "\n";
        std::cerr << "Use --help for usage information\n";
        return std::nullopt;
    }

    if (!base_url_given) {
        config.server.api_base_url =
            "http://localhost:" + std::to_string(config.server.port) + "/api";
    }

    return config;
}

}  // namespace boxlink::app
