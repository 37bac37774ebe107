/**
 * @file mock_thread_pool.hpp
 * @brief Controllable thread_pool_interface for delivery tests
 *
 * Push engine tests need three behaviours from the pool: run the send
 * job inline, hold it back (a peer that never answers), or run it on a
 * separate thread so the engine can be cancelled mid-send.
 */

#pragma once

#include <boxlink/integration/thread_pool_interface.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace boxlink::integration::testing {

class mock_thread_pool final : public thread_pool_interface {
public:
    enum class dispatch {
        inline_run,  ///< run on the submitting thread
        hold,        ///< keep until release_held()
        background   ///< run on one worker thread, FIFO
    };

    mock_thread_pool() = default;

    ~mock_thread_pool() override { shutdown(true); }

    [[nodiscard]] auto start() -> bool override {
        running_ = true;
        return true;
    }

    [[nodiscard]] auto is_running() const noexcept -> bool override { return running_; }

    void shutdown(bool /*wait_for_completion*/) override {
        std::thread worker;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
            stopping_ = true;
            worker = std::move(worker_);
        }
        cv_.notify_all();
        if (worker.joinable()) {
            worker.join();
        }
    }

    [[nodiscard]] auto submit(std::function<void()> task) -> std::future<void> override {
        std::packaged_task<void()> job(std::move(task));
        auto future = job.get_future();

        std::unique_lock<std::mutex> lock(mutex_);
        if (reject_) {
            throw std::runtime_error("delivery pool rejected the job");
        }
        ++submitted_;

        switch (dispatch_) {
            case dispatch::hold:
                held_.push_back(std::move(job));
                break;
            case dispatch::background:
                queue_.push_back(std::move(job));
                cv_.notify_one();
                break;
            case dispatch::inline_run:
                lock.unlock();
                job();
                break;
        }
        return future;
    }

    [[nodiscard]] auto worker_count() const -> std::size_t override { return 1; }

    [[nodiscard]] auto outstanding_jobs() const -> std::size_t override {
        std::lock_guard<std::mutex> lock(mutex_);
        return held_.size() + queue_.size();
    }

    // =========================================================================
    // Test controls
    // =========================================================================

    void set_dispatch(dispatch mode) {
        std::lock_guard<std::mutex> lock(mutex_);
        dispatch_ = mode;
        if (mode == dispatch::background && !worker_.joinable()) {
            stopping_ = false;
            worker_ = std::thread([this] { work(); });
        }
    }

    /// Every later submission throws, as a saturated pool would
    void set_reject_submissions(bool reject) {
        std::lock_guard<std::mutex> lock(mutex_);
        reject_ = reject;
    }

    /// Runs the held jobs on the calling thread; returns how many ran
    auto release_held() -> std::size_t {
        std::deque<std::packaged_task<void()>> jobs;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            jobs.swap(held_);
        }
        for (auto& job : jobs) {
            job();
        }
        return jobs.size();
    }

    /// Waits for the background queue to empty; false on timeout
    [[nodiscard]] auto drain(std::chrono::milliseconds timeout = std::chrono::seconds{5})
        -> bool {
        std::unique_lock<std::mutex> lock(mutex_);
        return idle_cv_.wait_for(lock, timeout,
                                 [this] { return queue_.empty() && !busy_; });
    }

    [[nodiscard]] auto submitted_count() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return submitted_;
    }

private:
    void work() {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            auto job = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;

            lock.unlock();
            job();
            lock.lock();

            busy_ = false;
            idle_cv_.notify_all();
        }
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;

    std::atomic<bool> running_{false};
    dispatch dispatch_{dispatch::inline_run};
    bool reject_{false};
    bool stopping_{false};
    bool busy_{false};

    std::size_t submitted_{0};
    std::deque<std::packaged_task<void()>> held_;
    std::deque<std::packaged_task<void()>> queue_;
    std::thread worker_;
};

}  // namespace boxlink::integration::testing
