/**
 * @file rest_server.hpp
 * @brief HTTP surface of a boxlink node
 *
 * One Crow application serves both the peer wire endpoints under
 * /api/box/<token> and the operator endpoints (/api/boxes, /api/outbox,
 * /api/inbox, /api/transactions).
 */

#pragma once

#include "rest_config.hpp"

#include <cstdint>
#include <memory>

namespace boxlink::client {
class box_service;
} // namespace boxlink::client

namespace boxlink::web {

/**
 * @code
 * rest_server server(config);
 * server.set_box_service(service);
 * server.start_async();
 * // ...
 * server.stop();
 * @endcode
 */
class rest_server {
public:
  rest_server();

  explicit rest_server(const rest_server_config &config);

  ~rest_server();

  rest_server(const rest_server &) = delete;
  rest_server &operator=(const rest_server &) = delete;

  rest_server(rest_server &&other) noexcept;
  rest_server &operator=(rest_server &&other) noexcept;

  [[nodiscard]] const rest_server_config &config() const noexcept;

  /// Takes effect on the next start
  void set_config(const rest_server_config &config);

  /**
   * @brief Coordinator behind every endpoint
   *
   * Until one is set, every endpoint answers 503.
   */
  void set_box_service(std::shared_ptr<client::box_service> service);

  /// Serve on the calling thread until stop() is called elsewhere
  void start();

  /**
   * @brief Serve on a background thread
   *
   * Returns once the listening socket is bound, so port() is valid
   * immediately afterwards even when the configured port is 0.
   */
  void start_async();

  /// Idempotent
  void stop();

  [[nodiscard]] bool is_running() const noexcept;

  void wait();

  /// Bound port, or 0 when not running
  [[nodiscard]] std::uint16_t port() const noexcept;

private:
  struct impl;
  std::unique_ptr<impl> impl_;
};

} // namespace boxlink::web
