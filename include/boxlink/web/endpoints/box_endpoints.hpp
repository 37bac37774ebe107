/**
 * @file box_endpoints.hpp
 * @brief Peer wire endpoints under /api/box/<token>
 *
 * These are the routes a remote box calls with the base URL this node
 * generated for it: pulling outbox entries, pushing images, and reporting
 * receive progress.
 */

#pragma once

#include <memory>

namespace boxlink::client {
class box_service;
} // namespace boxlink::client

namespace boxlink::web {

struct rest_server_config;

/**
 * @struct rest_server_context
 * @brief Shared context for REST endpoints
 */
struct rest_server_context {
  /// Current server configuration (read-only)
  const rest_server_config *config{nullptr};

  /// Coordinator serving every endpoint
  std::shared_ptr<client::box_service> box_service;
};

namespace endpoints {

// Internal function - implementation in cpp file
// Registers peer wire endpoints with the Crow app
// Called from rest_server.cpp

} // namespace endpoints

} // namespace boxlink::web
