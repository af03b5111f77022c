/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace thaw {

// Terminal and non-terminal states reported by the query execution engine.
enum class QueryState : std::uint8_t { Queued, Running, Succeeded, Failed, Cancelled, Missing };

using QueryId = std::string;
using JobHandle = std::string;
using ArchiveId = std::string;
using PartitionId = std::int64_t;
using RowSeq = std::int64_t;

// One archived object as listed by the partitioned inventory.
struct InventoryRow {
    RowSeq rowSeq = 0;
    std::uint64_t sizeBytes = 0;
    ArchiveId archiveId;
    std::string contentHash;
    std::string description;
    std::string creationTimestamp;
};

// Durable unit of progress, one per archive.
struct RetrievalStatusRecord {
    ArchiveId archiveId;
    JobHandle jobHandle;
    PartitionId partitionId = 0;
    RowSeq rowSeq = 0;
    std::string contentHash;
    std::uint64_t sizeBytes = 0;
    std::string requestTimestamp;
    std::string description;
    std::string resolvedName;
    std::uint64_t chunkCount = 0;
    std::uint32_t retryCount = 0;
};

// Invocation payload exchanged with the partition scheduler.
struct PartitionPointer {
    PartitionId nextPartition = 0;
    PartitionId maxPartition = 0;

    [[nodiscard]] bool done() const noexcept { return nextPartition > maxPartition; }
};

const char* queryStateToString(QueryState state) noexcept;

} // namespace thaw
