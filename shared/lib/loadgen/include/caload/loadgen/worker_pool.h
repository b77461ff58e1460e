/**
 * @file worker_pool.h
 * @brief Fixed-size worker pool with FIFO queue
 *
 * Thread-safe task dispatch for the generation and submission stages.
 * Features:
 * - Fixed number of worker threads (bounded concurrency)
 * - Work beyond capacity queues; submit never rejects while the pool is open
 * - waitIdle() barrier for stage completion
 * - Statistics (queued, active, completed, peak concurrency)
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace caload::loadgen {

class WorkerPool {
public:
    using Task = std::function<void()>;

    /**
     * @brief Start worker threads
     * @param workers Number of threads (must be >= 1)
     * @param name Pool name used in log lines
     * @throws std::invalid_argument if workers is 0
     */
    WorkerPool(size_t workers, std::string name);

    /**
     * @brief Destructor - drains the queue and joins all workers
     */
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue a task
     * @throws std::runtime_error after shutdown()
     */
    void submit(Task task);

    /**
     * @brief Block until the queue is empty and no task is running
     */
    void waitIdle();

    /**
     * @brief Finish queued tasks, then stop and join workers
     */
    void shutdown();

    struct Stats {
        size_t workers;
        size_t queued;
        size_t active;
        size_t completed;
        size_t peakActive;
    };

    Stats getStats() const;

private:
    void workerLoop(size_t index);

    std::string name_;
    std::vector<std::thread> threads_;
    std::queue<Task> tasks_;

    mutable std::mutex mutex_;
    std::condition_variable taskCv_;
    std::condition_variable idleCv_;

    size_t active_ = 0;
    size_t completed_ = 0;
    size_t peakActive_ = 0;
    bool shutdown_ = false;
};

} // namespace caload::loadgen
