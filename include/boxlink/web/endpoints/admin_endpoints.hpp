/**
 * @file admin_endpoints.hpp
 * @brief Administration endpoints for boxes, outbox, inbox and transactions
 *
 * Routes:
 * - GET/POST /api/boxes, GET/DELETE /api/boxes/<id>
 * - POST /api/boxes/<id>/send
 * - GET /api/outbox, DELETE /api/outbox/<id>
 * - GET /api/inbox, DELETE /api/inbox/<id>
 * - GET /api/transactions, POST /api/transactions/<box>/<tx>/retry
 */

#pragma once

#include <memory>

namespace boxlink::web {

struct rest_server_context;

namespace endpoints {

// Internal function - implementation in cpp file
// Registers administration endpoints with the Crow app
// Called from rest_server.cpp

} // namespace endpoints

} // namespace boxlink::web
