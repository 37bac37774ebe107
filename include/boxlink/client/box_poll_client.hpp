/**
 * @file box_poll_client.hpp
 * @brief Pulls the entries a PUSH peer has queued for this node
 */

#pragma once

#include <boxlink/client/box_types.hpp>
#include <boxlink/di/ilogger.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace boxlink::network {
class http_client;
}

namespace boxlink::storage {
class image_storage;
}

namespace boxlink::codec {
class payload_compressor;
}

namespace boxlink::client {

class inbox_manager;

/**
 * @brief Poll client timing
 */
struct poll_client_config {
    std::chrono::milliseconds poll_interval{5000};
};

/**
 * @brief Result of one run_cycle()
 */
enum class poll_outcome {
    no_work,    ///< Peer outbox empty or entry vanished
    received,   ///< Image stored and deleted on the peer
    failed,     ///< Transport, format or storage failure; retried next tick
    busy,       ///< Another cycle is running
    cancelled
};

/**
 * @brief Receiving side of a PUSH relationship
 *
 * The peer registered this node in POLL mode, so entries it queues for us
 * wait in its outbox. Each cycle fetches one entry, stores the image, records
 * inbox progress and deletes the entry on the peer. A received image is
 * followed immediately by the next poll.
 */
class box_poll_client {
public:
    box_poll_client(box remote_box,
                    std::shared_ptr<network::http_client> http,
                    std::shared_ptr<codec::payload_compressor> compressor,
                    std::shared_ptr<storage::image_storage> storage,
                    std::shared_ptr<inbox_manager> inbox,
                    poll_client_config config = {},
                    std::shared_ptr<di::ILogger> logger = nullptr);

    ~box_poll_client();

    box_poll_client(const box_poll_client&) = delete;
    auto operator=(const box_poll_client&) -> box_poll_client& = delete;

    void start();
    void stop();
    void wake();

    auto run_cycle() -> poll_outcome;

    [[nodiscard]] auto is_running() const noexcept -> bool;
    [[nodiscard]] auto remote_box() const -> const box&;

private:
    void run_loop();

    [[nodiscard]] auto receive_one() -> poll_outcome;

    [[nodiscard]] auto entry_url(const outbox_entry& entry) const -> std::string;

    box box_;
    std::shared_ptr<network::http_client> http_;
    std::shared_ptr<codec::payload_compressor> compressor_;
    std::shared_ptr<storage::image_storage> storage_;
    std::shared_ptr<inbox_manager> inbox_;
    poll_client_config config_;
    std::shared_ptr<di::ILogger> logger_;

    std::atomic<bool> busy_{false};
    std::atomic<bool> cancelled_{false};

    std::atomic<bool> running_{false};
    bool wake_requested_{false};
    std::thread worker_;
    std::condition_variable cv_;
    std::mutex cv_mutex_;
};

}  // namespace boxlink::client
