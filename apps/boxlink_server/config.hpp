/**
 * @file config.hpp
 * @brief Configuration management for the boxlink server
 */

#ifndef BOXLINK_APPS_BOXLINK_SERVER_CONFIG_HPP
#define BOXLINK_APPS_BOXLINK_SERVER_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace boxlink::app {

/**
 * @brief HTTP surface configuration
 */
struct server_network_config {
    /// Address to bind the REST server to
    std::string bind_address{"0.0.0.0"};

    /// Port to listen on
    std::uint16_t port{8080};

    /// Public API root advertised in generated base URLs
    std::string api_base_url{"http://localhost:8080/api"};
};

/**
 * @brief Image storage configuration
 */
struct storage_config {
    /// Root directory for stored datasets
    std::filesystem::path directory{"./images"};
};

/**
 * @brief Database configuration
 */
struct database_config {
    /// Path to SQLite database file
    std::filesystem::path path{"./boxlink.db"};

    /// Enable WAL (Write-Ahead Logging) mode for better concurrency
    bool wal_mode{true};
};

/**
 * @brief Logging configuration
 */
struct logging_config {
    /// Log level: "trace", "debug", "info", "warn", "error", "fatal"
    std::string level{"info"};

    /// Directory for log and audit files
    std::filesystem::path directory{"./logs"};

    /// Enable console output
    bool console{true};
};

/**
 * @brief Transfer worker configuration
 */
struct transfer_config {
    /// Idle poll interval of each push engine and poll client
    std::chrono::milliseconds poll_interval{5000};

    /// Threads of the delivery pool
    std::size_t workers{4};
};

/**
 * @brief Complete boxlink server configuration
 */
struct boxlink_server_config {
    server_network_config server;
    storage_config storage;
    database_config database;
    logging_config logging;
    transfer_config transfer;

    /**
     * @brief Parse configuration from command line arguments
     *
     * Supported options:
     *   --port <port>           Port to listen on (default: 8080)
     *   --api-base-url <url>    Public API root (default: http://localhost:<port>/api)
     *   --storage-dir <path>    Image directory (default: ./images)
     *   --db-path <path>        Database path (default: ./boxlink.db)
     *   --log-level <level>     Log level (default: info)
     *   --poll-interval <ms>    Worker idle interval (default: 5000)
     *   --workers <n>           Delivery threads (default: 4)
     *   --help                  Show help message
     *
     * @return Configuration or nullopt if --help was requested or error
     */
    static auto parse_args(int argc, char* argv[])
        -> std::optional<boxlink_server_config>;

    /**
     * @brief Print help message to stdout
     */
    static void print_help();
};

}  // namespace boxlink::app

#endif  // BOXLINK_APPS_BOXLINK_SERVER_CONFIG_HPP
