/**
 * @file liveness_tracker.hpp
 * @brief Online status of POLL peers derived from their last contact
 */

#pragma once

#include <boxlink/client/box_types.hpp>
#include <boxlink/di/ilogger.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>

namespace boxlink::storage {
class box_repository;
}

namespace boxlink::client {

/**
 * @brief Liveness configuration
 */
struct liveness_config {
    /// Sweep period
    std::chrono::milliseconds interval{5000};

    /// Delay before the first sweep after start()
    std::chrono::milliseconds initial_delay{100};

    /// A peer is online when it polled less than this long ago
    std::chrono::milliseconds online_threshold{15000};
};

/**
 * @brief Last-contact map for POLL peers with a periodic sweep
 *
 * Peers that never polled count as last seen at the clock's epoch. Only a
 * flip of the stored online flag is written back and reported.
 *
 * Thread Safety:
 * - record_contact() may be called from any request thread
 */
class liveness_tracker {
public:
    using clock = std::chrono::system_clock;

    explicit liveness_tracker(std::shared_ptr<storage::box_repository> boxes,
                              liveness_config config = {},
                              std::shared_ptr<di::ILogger> logger = nullptr);

    ~liveness_tracker();

    liveness_tracker(const liveness_tracker&) = delete;
    auto operator=(const liveness_tracker&) -> liveness_tracker& = delete;

    /// Start following a peer as "offline since epoch"
    void track(std::int64_t box_id);

    void untrack(std::int64_t box_id);

    /// Note that the peer polled at @p when
    void record_contact(std::int64_t box_id, clock::time_point when = clock::now());

    [[nodiscard]] auto last_contact(std::int64_t box_id) const
        -> std::optional<clock::time_point>;

    [[nodiscard]] auto tracked_count() const -> std::size_t;

    /**
     * @brief Recompute and persist the online flag of every tracked peer
     *
     * @return Number of peers whose flag changed
     */
    auto sweep(clock::time_point now = clock::now()) -> std::size_t;

    void start();
    void stop();
    [[nodiscard]] auto is_running() const noexcept -> bool;

    void set_status_callback(box_status_callback callback);

private:
    void run_loop();

    std::shared_ptr<storage::box_repository> boxes_;
    liveness_config config_;
    std::shared_ptr<di::ILogger> logger_;

    std::unordered_map<std::int64_t, clock::time_point> last_contact_;
    mutable std::mutex contact_mutex_;

    box_status_callback status_callback_;
    std::mutex callback_mutex_;

    std::atomic<bool> running_{false};
    std::thread worker_;
    std::condition_variable cv_;
    std::mutex cv_mutex_;
};

}  // namespace boxlink::client
