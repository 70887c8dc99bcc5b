/**
 * @file worker_pool.cpp
 * @brief WorkerPool implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/worker_pool.hpp"

namespace sandbox_engine {

WorkerPool::WorkerPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;  // fallback
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::post(std::function<void()> task) {
    {
        std::lock_guard lock(queue_mutex_);
        if (!accepting_) return false;
        task_queue_.push(std::move(task));
    }
    queue_cv_.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard lock(queue_mutex_);
        if (!accepting_ && workers_.empty()) return;
        accepting_ = false;
    }
    queue_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
    workers_.clear();
}

void WorkerPool::worker_loop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !task_queue_.empty() || !accepting_; });

            // Drained and closed
            if (task_queue_.empty()) return;

            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        task();
    }
}

size_t WorkerPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace sandbox_engine
