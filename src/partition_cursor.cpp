/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "thaw/partition_cursor.hpp"
#include "thaw/status_store.hpp"
#include "thaw/logger.hpp"

namespace thaw {

RowSeq PartitionCursor::maxProcessed(PartitionId partition) const {
    LOG_DEBUG("Checking last row number for partition: " + std::to_string(partition));
    RowSeq last = store_.maxRowSeq(partition);
    if (last <= 0) {
        LOG_INFO("No records for partition " + std::to_string(partition) + " found. Starting from row 0");
        return 0;
    }
    LOG_INFO("Last registered row for partition " + std::to_string(partition) + " is " + std::to_string(last));
    return last;
}

}
