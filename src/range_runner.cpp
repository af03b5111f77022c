/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "thaw/range_runner.hpp"
#include "thaw/cancel.hpp"
#include "thaw/errors.hpp"
#include "thaw/partition_driver.hpp"
#include "thaw/pool.hpp"
#include "thaw/logger.hpp"
#include <algorithm>
#include <mutex>
#include <set>

namespace thaw {

RangeRunner::RangeRunner(DriverFactory factory, int workers, const CancelToken* cancel)
    : factory_(std::move(factory)), workers_(workers < 1 ? 1 : workers), cancel_(cancel) {
}

RangeOutcome RangeRunner::run(PartitionPointer pointer) {
    if (pointer.done()) {
        LOG_INFO("Nothing to do: next partition " + std::to_string(pointer.nextPartition) +
                 " is past " + std::to_string(pointer.maxPartition));
        RangeOutcome outcome;
        outcome.pointer = pointer;
        return outcome;
    }
    return workers_ == 1 ? runSequential(pointer) : runConcurrent(pointer);
}

RangeOutcome RangeRunner::runSequential(PartitionPointer pointer) {
    RangeOutcome outcome;
    auto driver = factory_();

    while (!pointer.done()) {
        if (cancel_ && cancel_->cancelled()) {
            outcome.cancelled = true;
            break;
        }
        try {
            pointer = driver->run(pointer);
            ++outcome.completed;
        } catch (const Cancelled& e) {
            LOG_WARN(e.what());
            outcome.cancelled = true;
            break;
        } catch (const std::exception&) {
            // The same partition has to be re-run; stop here
            outcome.failed.push_back(pointer.nextPartition);
            break;
        }
    }

    outcome.pointer = pointer;
    return outcome;
}

RangeOutcome RangeRunner::runConcurrent(PartitionPointer pointer) {
    RangeOutcome outcome;
    std::mutex outcomeMutex;
    std::set<PartitionId> unfinished;
    for (PartitionId p = pointer.nextPartition; p <= pointer.maxPartition; ++p) {
        unfinished.insert(p);
    }

    Pool pool(workers_);
    bool started = pool.start([&](PartitionId partition, int) {
        if (cancel_ && cancel_->cancelled()) {
            std::lock_guard<std::mutex> lock(outcomeMutex);
            outcome.cancelled = true;
            return;
        }
        auto driver = factory_();
        try {
            (void)driver->run(PartitionPointer{partition, pointer.maxPartition});
            std::lock_guard<std::mutex> lock(outcomeMutex);
            unfinished.erase(partition);
            ++outcome.completed;
        } catch (const Cancelled& e) {
            LOG_WARN(e.what());
            std::lock_guard<std::mutex> lock(outcomeMutex);
            outcome.cancelled = true;
        } catch (const std::exception&) {
            std::lock_guard<std::mutex> lock(outcomeMutex);
            outcome.failed.push_back(partition);
        }
    });
    if (!started) {
        throw Error("could not start partition workers");
    }

    for (PartitionId p = pointer.nextPartition; p <= pointer.maxPartition; ++p) {
        pool.submit(p);
    }
    pool.waitIdle();
    pool.stop();

    std::sort(outcome.failed.begin(), outcome.failed.end());
    outcome.pointer = pointer;
    outcome.pointer.nextPartition = unfinished.empty() ? pointer.maxPartition + 1 : *unfinished.begin();
    return outcome;
}

}
