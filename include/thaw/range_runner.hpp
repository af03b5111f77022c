/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

#include "thaw/types.hpp"

namespace thaw {

class CancelToken;
class PartitionDriver;

struct RangeOutcome {
    PartitionPointer pointer;
    std::size_t completed = 0;
    std::vector<PartitionId> failed;
    bool cancelled = false;

    [[nodiscard]] bool ok() const noexcept { return failed.empty() && !cancelled && pointer.done(); }
};

// Scheduler side of the partition loop: drives partitions until
// nextPartition passes maxPartition.
class RangeRunner {
public:
    using DriverFactory = std::function<std::unique_ptr<PartitionDriver>()>;

    RangeRunner(DriverFactory factory, int workers, const CancelToken* cancel = nullptr);

    // Sequential mode stops at the first failed partition. With several
    // workers every partition is attempted and the returned pointer names
    // the lowest one that did not complete.
    [[nodiscard]] RangeOutcome run(PartitionPointer pointer);

private:
    DriverFactory factory_;
    int workers_;
    const CancelToken* cancel_;

    [[nodiscard]] RangeOutcome runSequential(PartitionPointer pointer);
    [[nodiscard]] RangeOutcome runConcurrent(PartitionPointer pointer);
};

}
