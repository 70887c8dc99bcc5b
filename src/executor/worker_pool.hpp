/**
 * @file worker_pool.hpp
 * @brief std::jthread-based worker pool that drains its queue on shutdown.
 * @author Dimitris Kafetzis
 *
 * Every posted task runs exactly once, even when the pool is being torn
 * down: a dispatched execution must always reach a terminal state.
 */

#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace sandbox_engine {

class WorkerPool {
public:
    explicit WorkerPool(size_t num_threads = 0);
    ~WorkerPool();

    // Non-copyable, non-movable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Enqueue a fire-and-forget task. Returns false after shutdown().
    bool post(std::function<void()> task);

    /// Stop accepting work, run everything already queued, join workers.
    void shutdown();

    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void worker_loop();

    std::vector<std::jthread> workers_;
    std::queue<std::function<void()>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    bool accepting_ = true;
};

}  // namespace sandbox_engine
