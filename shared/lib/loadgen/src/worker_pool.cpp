/**
 * @file worker_pool.cpp
 * @brief WorkerPool implementation
 */

#include "caload/loadgen/worker_pool.h"

#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace caload::loadgen {

WorkerPool::WorkerPool(size_t workers, std::string name)
    : name_(std::move(name)) {
    if (workers == 0) {
        throw std::invalid_argument("WorkerPool requires at least one worker");
    }

    threads_.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        threads_.emplace_back(&WorkerPool::workerLoop, this, i);
    }

    spdlog::debug("[{}] Worker pool started with {} threads", name_, workers);
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            throw std::runtime_error("WorkerPool '" + name_ + "' is shut down");
        }
        tasks_.push(std::move(task));
    }
    taskCv_.notify_one();
}

void WorkerPool::waitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idleCv_.wait(lock, [this]() { return tasks_.empty() && active_ == 0; });
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_ && threads_.empty()) {
            return;
        }
        shutdown_ = true;
    }
    taskCv_.notify_all();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    spdlog::debug("[{}] Worker pool stopped ({} tasks completed)", name_, completed_);
}

WorkerPool::Stats WorkerPool::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Stats{threads_.size(), tasks_.size(), active_, completed_, peakActive_};
}

void WorkerPool::workerLoop(size_t index) {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            taskCv_.wait(lock, [this]() { return shutdown_ || !tasks_.empty(); });

            // Queued work is drained before exit
            if (tasks_.empty()) {
                break;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_;
            peakActive_ = std::max(peakActive_, active_);
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("[{}] Worker {} task failed: {}", name_, index, e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
            ++completed_;
        }
        idleCv_.notify_all();
    }
}

} // namespace caload::loadgen
