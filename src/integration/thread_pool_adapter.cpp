/**
 * @file thread_pool_adapter.cpp
 * @brief thread_system backed delivery pool
 */

#include <boxlink/integration/thread_pool_adapter.hpp>

#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/interfaces/thread_context.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace boxlink::integration {

thread_pool_adapter::thread_pool_adapter(thread_pool_config config)
    : config_(std::move(config)) {
    if (config_.worker_count == 0) {
        config_.worker_count = 1;
    }
}

thread_pool_adapter::~thread_pool_adapter() {
    shutdown(true);
}

auto thread_pool_adapter::start() -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return ensure_started();
}

auto thread_pool_adapter::ensure_started() -> bool {
    if (pool_ && pool_->is_running()) {
        return true;
    }

    kcenon::thread::thread_context context;
    auto pool = std::make_shared<kcenon::thread::thread_pool>(config_.pool_name, context);

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    for (std::size_t i = 0; i < config_.worker_count; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>(false, context));
    }
    if (pool->enqueue_batch(std::move(workers)).is_err() || pool->start().is_err()) {
        return false;
    }

    pool_ = std::move(pool);
    return true;
}

auto thread_pool_adapter::is_running() const noexcept -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_ && pool_->is_running();
}

void thread_pool_adapter::shutdown(bool wait_for_completion) {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pool = std::move(pool_);
    }
    if (pool) {
        pool->stop(!wait_for_completion);
    }
}

auto thread_pool_adapter::submit(std::function<void()> task) -> std::future<void> {
    auto job = std::make_shared<std::packaged_task<void()>>(std::move(task));
    auto future = job->get_future();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensure_started()) {
        throw std::runtime_error("Delivery pool '" + config_.pool_name + "' failed to start");
    }

    outstanding_->fetch_add(1);
    auto counter = outstanding_;
    try {
        (void)pool_->submit([job, counter] {
            (*job)();
            counter->fetch_sub(1);
        });
    } catch (const std::exception& e) {
        outstanding_->fetch_sub(1);
        throw std::runtime_error("Delivery pool rejected job: " + std::string(e.what()));
    }
    return future;
}

auto thread_pool_adapter::worker_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_ ? config_.worker_count : 0;
}

auto thread_pool_adapter::outstanding_jobs() const -> std::size_t {
    return outstanding_->load();
}

}  // namespace boxlink::integration
