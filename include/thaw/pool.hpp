/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "thaw/types.hpp"

namespace thaw {

using PartitionTask = std::function<void(PartitionId, int workerId)>;

// Fixed set of worker threads, each processing one partition at a time.
class Pool {
public:
    explicit Pool(int workers) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(PartitionTask task);
    void stop() noexcept;
    void submit(PartitionId partition) noexcept;

    // Blocks until the queue is empty and no worker is busy.
    void waitIdle();

private:
    void workerLoop(int workerId);

    int workers_;
    PartitionTask task_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    mutable std::mutex queueMutex_;
    std::condition_variable workAvailable_;
    std::condition_variable idle_;
    std::queue<PartitionId> queue_;
    int busy_ = 0;

    std::vector<std::thread> workerThreads_;
};

}
