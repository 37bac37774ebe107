/**
 * @file server_app.hpp
 * @brief boxlink server application class
 */

#ifndef BOXLINK_APPS_BOXLINK_SERVER_SERVER_APP_HPP
#define BOXLINK_APPS_BOXLINK_SERVER_SERVER_APP_HPP

#include "config.hpp"

#include <boxlink/client/box_service.hpp>
#include <boxlink/integration/thread_pool_interface.hpp>
#include <boxlink/storage/box_database.hpp>
#include <boxlink/web/rest_server.hpp>

#include <atomic>
#include <memory>

namespace boxlink::app {

/**
 * @brief A boxlink node: database, delivery workers and REST surface
 *
 * ```
 * +-------------------------------------------+
 * |            boxlink_server_app             |
 * +-------------------------------------------+
 * |  rest_server  ----->  box_service         |
 * |                        |  push engines    |
 * |                        |  poll clients    |
 * |                        |  liveness        |
 * |                        v                  |
 * |  box_database   file_image_storage        |
 * +-------------------------------------------+
 * ```
 */
class boxlink_server_app {
public:
    explicit boxlink_server_app(const boxlink_server_config& config);

    /**
     * @brief Destructor - stops server if running
     */
    ~boxlink_server_app();

    boxlink_server_app(const boxlink_server_app&) = delete;
    boxlink_server_app& operator=(const boxlink_server_app&) = delete;
    boxlink_server_app(boxlink_server_app&&) = delete;
    boxlink_server_app& operator=(boxlink_server_app&&) = delete;

    // =========================================================================
    // Lifecycle Management
    // =========================================================================

    /**
     * @brief Set up logging, database, storage and the coordinator
     *
     * Must be called before start().
     */
    [[nodiscard]] bool initialize();

    /**
     * @brief Start the delivery workers and the REST server
     */
    [[nodiscard]] bool start();

    /**
     * @brief Stop the REST server, then the workers, then the pool
     */
    void stop();

    /**
     * @brief Block until request_shutdown() is called
     */
    void wait_for_shutdown();

    /**
     * @brief Request shutdown
     *
     * Only sets a flag, so it may be called from a signal handler.
     */
    void request_shutdown() noexcept;

    [[nodiscard]] bool is_running() const noexcept;

    /**
     * @brief Print box and queue counts to stdout
     */
    void print_statistics() const;

private:
    [[nodiscard]] bool setup_database();
    [[nodiscard]] bool setup_services();

    boxlink_server_config config_;

    std::shared_ptr<storage::box_database> database_;
    std::shared_ptr<integration::thread_pool_interface> thread_pool_;
    std::shared_ptr<client::box_service> service_;
    std::unique_ptr<web::rest_server> rest_server_;

    std::atomic<bool> shutdown_requested_{false};
    bool initialized_{false};
    bool running_{false};
};

}  // namespace boxlink::app

#endif  // BOXLINK_APPS_BOXLINK_SERVER_SERVER_APP_HPP
