/**
 * @file box_service.hpp
 * @brief Coordinator of peer relationships and their delivery workers
 *
 * box_service owns the transfer components of one node: the outbox and
 * inbox bookkeeping, the liveness tracker, the poll service used by the REST
 * layer, and one push engine plus one poll client per PUSH peer.
 */

#pragma once

#include <boxlink/client/box_poll_client.hpp>
#include <boxlink/client/box_push_engine.hpp>
#include <boxlink/client/box_types.hpp>
#include <boxlink/client/liveness_tracker.hpp>
#include <boxlink/core/result.hpp>
#include <boxlink/di/ilogger.hpp>

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace boxlink::storage {
class box_database;
class box_repository;
class image_storage;
class inbox_repository;
class outbox_repository;
}  // namespace boxlink::storage

namespace boxlink::codec {
class payload_compressor;
}

namespace boxlink::network {
class http_client;
}

namespace boxlink::integration {
class thread_pool_interface;
}

namespace boxlink::client {

class image_anonymizer;
class inbox_manager;
class outbox_manager;
class poll_service;
class transfer_payload_builder;

/**
 * @brief Coordinator configuration
 */
struct box_service_config {
    /// Public API root of this node; generated base URLs are
    /// "{api_base_url}/box/{token}"
    std::string api_base_url{"http://localhost:8080/api"};

    push_engine_config push;
    poll_client_config poll;
    liveness_config liveness;
};

/**
 * @brief Collaborators injected into box_service
 */
struct box_service_dependencies {
    std::shared_ptr<storage::box_database> database;
    std::shared_ptr<storage::image_storage> storage;
    std::shared_ptr<image_anonymizer> anonymizer;
    std::shared_ptr<codec::payload_compressor> compressor;
    std::shared_ptr<network::http_client> http;
    std::shared_ptr<integration::thread_pool_interface> thread_pool;
};

/**
 * @brief Box registry, send intake and worker lifecycle
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - Callbacks are invoked from worker or request threads
 *
 * @code
 * box_service service(deps, config, logger);
 * service.start();
 *
 * // Offer a URL to a peer that will pull from us
 * auto poll_box = service.generate_base_url("hospital-b");
 *
 * // Adopt the URL a peer generated for us
 * auto push_box = service.add_remote_box("hospital-c", url_from_peer);
 * auto tx = service.send_images(push_box.value().id, {5, 6, 7});
 * @endcode
 */
class box_service {
public:
    box_service(box_service_dependencies deps,
                box_service_config config = {},
                std::shared_ptr<di::ILogger> logger = nullptr);

    ~box_service();

    box_service(const box_service&) = delete;
    auto operator=(const box_service&) -> box_service& = delete;
    box_service(box_service&&) = delete;
    auto operator=(box_service&&) -> box_service& = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /**
     * @brief Start workers for every stored PUSH box and the liveness sweep
     */
    void start();

    /**
     * @brief Stop every worker; blocks until they have exited
     */
    void stop();

    [[nodiscard]] auto is_running() const noexcept -> bool;

    // =========================================================================
    // Box Registry
    // =========================================================================

    /**
     * @brief Create a POLL box and the base URL the peer should adopt
     */
    [[nodiscard]] auto generate_base_url(std::string_view name) -> Result<box>;

    /**
     * @brief Adopt a peer's base URL as a PUSH box
     *
     * Returns the existing box if the URL is already registered in PUSH
     * mode.
     *
     * @return malformed_base_url when the last path segment is not a UUID
     */
    [[nodiscard]] auto add_remote_box(std::string_view name, std::string_view base_url)
        -> Result<box>;

    /**
     * @brief Stop the box's workers, then delete it with its entries
     */
    [[nodiscard]] auto remove_box(std::int64_t box_id) -> VoidResult;

    [[nodiscard]] auto list_boxes() const -> std::vector<box>;

    [[nodiscard]] auto get_box(std::int64_t box_id) const -> std::optional<box>;

    // =========================================================================
    // Transfers
    // =========================================================================

    [[nodiscard]] auto send_images(std::int64_t box_id,
                                   const std::vector<std::int64_t>& image_ids,
                                   const std::vector<outbox_tag_value>& tag_values = {})
        -> Result<std::int64_t>;

    [[nodiscard]] auto outbox_info() const -> std::vector<outbox_entry_info>;

    [[nodiscard]] auto inbox_info() const -> std::vector<inbox_entry_info>;

    [[nodiscard]] auto transactions() const -> std::vector<outbox_transaction_summary>;

    [[nodiscard]] auto remove_outbox_entry(std::int64_t id) -> VoidResult;

    [[nodiscard]] auto remove_inbox_entry(std::int64_t id) -> VoidResult;

    /**
     * @brief Reset a WAITING or FAILED transaction and wake its engine
     */
    [[nodiscard]] auto retry_transaction(std::int64_t box_id, std::int64_t transaction_id)
        -> VoidResult;

    // =========================================================================
    // Components
    // =========================================================================

    [[nodiscard]] auto poll_endpoint() const -> std::shared_ptr<poll_service>;

    [[nodiscard]] auto outbox() const -> std::shared_ptr<outbox_manager>;

    [[nodiscard]] auto inbox() const -> std::shared_ptr<inbox_manager>;

    [[nodiscard]] auto liveness() const -> std::shared_ptr<liveness_tracker>;

    [[nodiscard]] auto has_workers(std::int64_t box_id) const -> bool;

    // =========================================================================
    // Callbacks
    // =========================================================================

    void set_transfer_callback(transfer_callback callback);
    void set_receive_callback(transfer_callback callback);
    void set_status_callback(box_status_callback callback);

    // =========================================================================
    // Tokens
    // =========================================================================

    /// Lowercase RFC 4122 version 4 UUID
    [[nodiscard]] auto generate_token() -> std::string;

    [[nodiscard]] static auto is_valid_token(std::string_view token) -> bool;

    /**
     * @brief Token of a base URL: its last path segment
     *
     * One trailing slash is ignored.
     */
    [[nodiscard]] static auto extract_token(std::string_view base_url)
        -> Result<std::string>;

private:
    struct box_workers {
        std::unique_ptr<box_push_engine> push;
        std::unique_ptr<box_poll_client> poll;
    };

    void start_workers(const box& b);
    void stop_workers(std::int64_t box_id);

    [[nodiscard]] auto box_display_name(std::int64_t box_id) const -> std::string;

    box_service_dependencies deps_;
    box_service_config config_;
    std::shared_ptr<di::ILogger> logger_;

    std::shared_ptr<storage::box_repository> boxes_;
    std::shared_ptr<storage::outbox_repository> outbox_repo_;
    std::shared_ptr<storage::inbox_repository> inbox_repo_;

    std::shared_ptr<outbox_manager> outbox_;
    std::shared_ptr<inbox_manager> inbox_;
    std::shared_ptr<liveness_tracker> liveness_;
    std::shared_ptr<transfer_payload_builder> payloads_;
    std::shared_ptr<poll_service> poll_service_;

    std::map<std::int64_t, box_workers> workers_;
    mutable std::mutex workers_mutex_;

    std::mt19937_64 token_rng_;
    std::mutex token_mutex_;

    std::atomic<bool> running_{false};
};

}  // namespace boxlink::client
