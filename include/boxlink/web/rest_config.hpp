/**
 * @file rest_config.hpp
 * @brief Configuration for the REST server
 *
 * Bind address, port, worker count and CORS settings of the HTTP surface
 * that serves both peer wire requests and box administration.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace boxlink::web {

/**
 * @struct rest_server_config
 * @brief Configuration options for the REST server
 */
struct rest_server_config {
  /// Address to bind the server to
  std::string bind_address{"0.0.0.0"};

  /// Port to listen on
  std::uint16_t port{8080};

  /// Number of worker threads for handling requests
  std::size_t concurrency{4};

  /// Enable CORS (Cross-Origin Resource Sharing) headers
  bool enable_cors{true};

  /// CORS allowed origins (empty = no header)
  std::string cors_allowed_origins{"*"};

  /// Request timeout in seconds
  std::uint32_t request_timeout_seconds{60};

  /// Maximum request body size in bytes; a pushed image is one body
  std::size_t max_body_size{512 * 1024 * 1024};
};

} // namespace boxlink::web
