/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "thaw/pool.hpp"
#include "thaw/logger.hpp"

namespace thaw {

Pool::Pool(int workers) noexcept : workers_(workers < 1 ? 1 : workers) {
    LOG_DEBUG("Pool created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start(PartitionTask task) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    if (!task) {
        LOG_ERROR("Invalid partition task provided");
        return false;
    }

    task_ = std::move(task);
    running_.store(true);
    shutdown_.store(false);

    try {
        workerThreads_.reserve(workers_);
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }

        LOG_DEBUG("Pool started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping pool...");

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
        running_.store(false);
    }
    workAvailable_.notify_all();

    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    workerThreads_.clear();

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        while (!queue_.empty()) {
            queue_.pop();
        }
    }
    idle_.notify_all();

    LOG_DEBUG("Pool stopped");
}

void Pool::submit(PartitionId partition) noexcept {
    if (!running_.load() || shutdown_.load()) {
        LOG_DEBUG("Cannot submit partition to stopped pool: " + std::to_string(partition));
        return;
    }

    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            queue_.push(partition);
        }

        workAvailable_.notify_one();
        LOG_TRACE("Partition queued: " + std::to_string(partition));
    } catch (...) {
        LOG_ERROR("Failed to queue partition: " + std::to_string(partition));
    }
}

void Pool::waitIdle() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    idle_.wait(lock, [this] {
        return (queue_.empty() && busy_ == 0) || shutdown_.load();
    });
}

void Pool::workerLoop(int workerId) {
    setThreadName("Partition-" + std::to_string(workerId));
    LOG_DEBUG("Worker " + std::to_string(workerId) + " started");

    while (true) {
        PartitionId partition;

        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            workAvailable_.wait(lock, [this] {
                return !queue_.empty() || shutdown_.load();
            });

            if (shutdown_.load()) {
                break;
            }

            partition = queue_.front();
            queue_.pop();
            ++busy_;
        }

        // The task reports its own failures; anything escaping is a bug
        // in the task and must not take the worker down with it.
        try {
            task_(partition, workerId);
        } catch (const std::exception& e) {
            LOG_ERROR("Worker " + std::to_string(workerId) + " partition " + std::to_string(partition) +
                      " error: " + e.what());
        } catch (...) {
            LOG_ERROR("Worker " + std::to_string(workerId) + " unknown error on partition " +
                      std::to_string(partition));
        }

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            --busy_;
        }
        idle_.notify_all();
    }

    LOG_DEBUG("Worker " + std::to_string(workerId) + " stopped");
}

}
