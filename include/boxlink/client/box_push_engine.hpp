/**
 * @file box_push_engine.hpp
 * @brief Per-peer push delivery state machine
 *
 * One engine exists per PUSH box. It drains the box's outbox one entry at a
 * time, sending each image with an HTTP POST to the peer.
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
#include <string>
#include <thread>

namespace boxlink::integration {
class thread_pool_interface;
}

namespace boxlink::network {
class http_client;
}

namespace boxlink::client {

class outbox_manager;
class transfer_payload_builder;

/**
 * @brief Push engine timing
 */
struct push_engine_config {
    /// Idle re-check period
    std::chrono::milliseconds poll_interval{5000};

    /// Bound on one send attempt (payload preparation plus HTTP exchange)
    std::chrono::milliseconds receive_timeout{60000};
};

/**
 * @brief Engine state
 */
enum class push_state { idle, sending };

[[nodiscard]] inline const char* to_string(push_state state) noexcept {
    return state == push_state::sending ? "sending" : "idle";
}

/**
 * @brief Result of one run_cycle()
 */
enum class push_outcome {
    no_work,       ///< Nothing pending for this peer
    delivered,     ///< 2xx, entry acknowledged
    soft_failed,   ///< 5xx or local fault, transaction WAITING
    hard_failed,   ///< Other status or missing data, transaction FAILED
    timed_out,     ///< No result within receive_timeout
    busy,          ///< Another attempt, possibly an abandoned one, is in flight
    cancelled      ///< stop() was called during the attempt
};

[[nodiscard]] inline const char* to_string(push_outcome outcome) noexcept {
    switch (outcome) {
        case push_outcome::no_work: return "no_work";
        case push_outcome::delivered: return "delivered";
        case push_outcome::soft_failed: return "soft_failed";
        case push_outcome::hard_failed: return "hard_failed";
        case push_outcome::timed_out: return "timed_out";
        case push_outcome::busy: return "busy";
        case push_outcome::cancelled: return "cancelled";
        default: return "unknown";
    }
}

/**
 * @brief Status of a finished send attempt
 *
 * Local failures are mapped onto HTTP-like codes: 400 for data that cannot
 * be sent (missing image), 500 for anything transient.
 */
struct delivery_result {
    int status_code{0};
    std::string message;
};

/**
 * @brief Idle/Sending delivery loop for one PUSH peer
 *
 * The send job itself runs on the shared thread pool; the engine thread
 * waits for its result, bounded by receive_timeout, and applies it. A
 * successful delivery is followed immediately by the next attempt; otherwise
 * the engine sleeps until the next tick or wake().
 *
 * stop() cancels the attempt in flight: its result is discarded and no
 * further attempt is made.
 *
 * A timed-out or cancelled job keeps its pool worker until it returns. It
 * does not POST if it has not started to, and run_cycle() answers busy
 * until it has returned, so at most one request per peer is outstanding.
 */
class box_push_engine {
public:
    box_push_engine(box remote_box,
                    std::shared_ptr<outbox_manager> outbox,
                    std::shared_ptr<transfer_payload_builder> payloads,
                    std::shared_ptr<network::http_client> http,
                    std::shared_ptr<integration::thread_pool_interface> pool,
                    push_engine_config config = {},
                    std::shared_ptr<di::ILogger> logger = nullptr);

    ~box_push_engine();

    box_push_engine(const box_push_engine&) = delete;
    auto operator=(const box_push_engine&) -> box_push_engine& = delete;
    box_push_engine(box_push_engine&&) = delete;
    auto operator=(box_push_engine&&) -> box_push_engine& = delete;

    void start();

    /**
     * @brief Cancel any attempt in flight and join the engine thread
     */
    void stop();

    /// Skip the remaining wait of the current tick
    void wake();

    /**
     * @brief Perform a single Idle -> Sending -> Idle pass on the caller thread
     */
    auto run_cycle() -> push_outcome;

    [[nodiscard]] auto state() const noexcept -> push_state;
    [[nodiscard]] auto is_running() const noexcept -> bool;
    [[nodiscard]] auto remote_box() const -> const box&;

    /// Number of completed POST exchanges, whatever their status
    [[nodiscard]] auto attempt_count() const noexcept -> std::size_t;

private:
    struct attempt;

    void run_loop();

    [[nodiscard]] auto apply_result(const outbox_entry& entry,
                                    const delivery_result& result) -> push_outcome;

    [[nodiscard]] auto image_url(const outbox_entry& entry) const -> std::string;

    box box_;
    std::shared_ptr<outbox_manager> outbox_;
    std::shared_ptr<transfer_payload_builder> payloads_;
    std::shared_ptr<network::http_client> http_;
    std::shared_ptr<integration::thread_pool_interface> pool_;
    push_engine_config config_;
    std::shared_ptr<di::ILogger> logger_;

    std::atomic<push_state> state_{push_state::idle};
    std::shared_ptr<std::atomic<bool>> cancelled_;
    // Last timed-out or cancelled attempt; only touched while sending
    std::shared_ptr<attempt> abandoned_;
    std::atomic<std::size_t> attempts_{0};

    std::atomic<bool> running_{false};
    bool wake_requested_{false};
    std::thread worker_;
    std::condition_variable cv_;
    std::mutex cv_mutex_;
};

}  // namespace boxlink::client
