/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "ThreadPool.h"
#include <algorithm>
#include <chrono>

ThreadPool::ThreadPool(size_t num_threads) {
    size_t count = num_threads != 0
                       ? num_threads
                       : std::max<size_t>(1, std::thread::hardware_concurrency());
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back(&ThreadPool::workerLoop, this);
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    wake_.notify_all();
    for (auto& worker : workers_) {
        worker.join();
    }
}

void ThreadPool::workerLoop() {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            wake_.wait(lock, [this] { return closed_ || !queue_.empty(); });
            // Closed and drained
            if (queue_.empty()) {
                return;
            }
            job = std::move(queue_.front());
            queue_.pop_front();
        }

        // packaged_task captures exceptions, so job() does not throw
        auto start = std::chrono::steady_clock::now();
        job();
        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start);
        metrics_.total_execution_time_us.fetch_add(static_cast<uint64_t>(elapsed.count()));
        metrics_.tasks_completed.fetch_add(1);
    }
}
