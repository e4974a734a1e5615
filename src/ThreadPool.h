/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

/**
 * @file ThreadPool.h
 * @brief Fixed-size worker pool for chunked pattern search
 *
 * PatternSearch::findAllParallel submits one scan per haystack chunk and
 * collects the futures in chunk order. A chunk that throws stores its
 * exception in its future; future::get() rethrows it on the caller's thread.
 *
 * The destructor closes the queue, lets the workers finish every chunk
 * already submitted, then joins them, so no future is left without a result.
 */

/**
 * @brief Chunk counters, reported with -vv
 */
struct ThreadPoolMetrics {
    std::atomic<uint64_t> tasks_submitted{0};
    std::atomic<uint64_t> tasks_completed{0};
    std::atomic<uint64_t> total_execution_time_us{0};

    /// Mean chunk scan time in microseconds
    double getAverageExecutionTime() const {
        uint64_t completed = tasks_completed.load();
        return completed == 0 ? 0.0
                              : static_cast<double>(total_execution_time_us.load()) / completed;
    }
};

class ThreadPool {
public:
    /**
     * @param num_threads Number of workers (0 = hardware concurrency)
     */
    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue a callable and return a future for its result
     * @throws std::runtime_error once the pool is shutting down
     */
    template<class F, class... Args>
    auto submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>>;

    const ThreadPoolMetrics& getMetrics() const { return metrics_; }
    size_t getThreadCount() const { return workers_.size(); }

private:
    void workerLoop();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable wake_;
    bool closed_ = false;  ///< Guarded by mutex_
    ThreadPoolMetrics metrics_;
};

template<class F, class... Args>
auto ThreadPool::submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
    using Result = std::invoke_result_t<F, Args...>;

    auto job = std::make_shared<std::packaged_task<Result()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...));
    std::future<Result> future = job->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            throw std::runtime_error("ThreadPool is shutting down, chunk rejected");
        }
        queue_.emplace_back([job]() { (*job)(); });
    }
    metrics_.tasks_submitted.fetch_add(1);
    wake_.notify_one();
    return future;
}
