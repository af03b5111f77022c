/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include "thaw/types.hpp"

namespace thaw {

class StatusStore;

// Last row already recorded for a partition. The secondary index may lag
// recent writes; a stale answer only causes rows to be looked at again.
class PartitionCursor {
public:
    explicit PartitionCursor(const StatusStore& store) noexcept : store_(store) {}

    [[nodiscard]] RowSeq maxProcessed(PartitionId partition) const;

private:
    const StatusStore& store_;
};

}
