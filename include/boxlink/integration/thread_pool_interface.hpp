/**
 * @file thread_pool_interface.hpp
 * @brief Worker pool on which push delivery jobs run
 *
 * Every push engine hands its HTTP send to the shared pool and waits on
 * the returned future with its own timeout, so a stalled peer occupies a
 * worker but never the engine thread of another peer.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <string>

namespace boxlink::integration {

struct thread_pool_config {
    /// Fixed number of delivery workers
    std::size_t worker_count = 4;

    std::string pool_name = "boxlink_delivery";
};

class thread_pool_interface {
public:
    virtual ~thread_pool_interface() = default;

    [[nodiscard]] virtual auto start() -> bool = 0;

    [[nodiscard]] virtual auto is_running() const noexcept -> bool = 0;

    virtual void shutdown(bool wait_for_completion = true) = 0;

    /**
     * @brief Queue a job
     *
     * The future becomes ready when the job returns, holding any exception
     * it threw. Throws std::runtime_error when the pool cannot take work.
     */
    [[nodiscard]] virtual auto submit(std::function<void()> task)
        -> std::future<void> = 0;

    [[nodiscard]] virtual auto worker_count() const -> std::size_t = 0;

    /// Jobs submitted but not yet finished
    [[nodiscard]] virtual auto outstanding_jobs() const -> std::size_t = 0;

protected:
    thread_pool_interface() = default;
    thread_pool_interface(const thread_pool_interface&) = delete;
    thread_pool_interface& operator=(const thread_pool_interface&) = delete;
};

}  // namespace boxlink::integration
