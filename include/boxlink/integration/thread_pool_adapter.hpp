/**
 * @file thread_pool_adapter.hpp
 * @brief Delivery pool backed by thread_system
 *
 * @see thread_system/include/kcenon/thread/core/thread_pool.h
 */

#pragma once

#include <boxlink/integration/thread_pool_interface.hpp>

#include <atomic>
#include <memory>
#include <mutex>

namespace kcenon::thread {
class thread_pool;
}  // namespace kcenon::thread

namespace boxlink::integration {

/**
 * @brief thread_pool_interface over kcenon::thread::thread_pool
 *
 * The first submit() starts the pool when start() was not called.
 * outstanding_jobs() counts jobs from submission until they return.
 */
class thread_pool_adapter final : public thread_pool_interface {
public:
    explicit thread_pool_adapter(thread_pool_config config);

    ~thread_pool_adapter() override;

    [[nodiscard]] auto start() -> bool override;
    [[nodiscard]] auto is_running() const noexcept -> bool override;
    void shutdown(bool wait_for_completion = true) override;

    [[nodiscard]] auto submit(std::function<void()> task) -> std::future<void> override;

    [[nodiscard]] auto worker_count() const -> std::size_t override;
    [[nodiscard]] auto outstanding_jobs() const -> std::size_t override;

    [[nodiscard]] auto config() const noexcept -> const thread_pool_config& { return config_; }

private:
    [[nodiscard]] auto ensure_started() -> bool;

    thread_pool_config config_;
    mutable std::mutex mutex_;
    std::shared_ptr<kcenon::thread::thread_pool> pool_;
    std::shared_ptr<std::atomic<std::size_t>> outstanding_ =
        std::make_shared<std::atomic<std::size_t>>(0);
};

}  // namespace boxlink::integration
