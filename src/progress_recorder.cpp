/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "thaw/progress_recorder.hpp"
#include "thaw/chunk.hpp"
#include "thaw/status_store.hpp"
#include "thaw/logger.hpp"
#include <ctime>

namespace thaw {

std::string isoTimestamp(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&t, &local);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &local);
    char zone[8];
    std::strftime(zone, sizeof(zone), "%z", &local);

    // %z is +hhmm, the record format wants +hh:mm
    std::string offset(zone);
    if (offset.size() == 5) {
        offset.insert(3, ":");
    }
    return std::string(date) + offset;
}

ProgressRecorder::ProgressRecorder(StatusStore& store, std::uint64_t chunkSize) noexcept
    : store_(store), chunkSize_(chunkSize) {
}

RetrievalStatusRecord ProgressRecorder::makeRecord(PartitionId partition, const InventoryRow& row,
                                                   const JobHandle& jobHandle,
                                                   const std::string& resolvedName) const {
    RetrievalStatusRecord record;
    record.archiveId = row.archiveId;
    record.jobHandle = jobHandle;
    record.partitionId = partition;
    record.rowSeq = row.rowSeq;
    record.contentHash = row.contentHash;
    record.sizeBytes = row.sizeBytes;
    record.requestTimestamp = isoTimestamp(std::chrono::system_clock::now());
    record.description = row.description;
    record.resolvedName = resolvedName;
    record.chunkCount = chunkCount(row.sizeBytes, chunkSize_);
    record.retryCount = 0;
    return record;
}

bool ProgressRecorder::record(PartitionId partition, const InventoryRow& row, const JobHandle& jobHandle,
                              const std::string& resolvedName) {
    RetrievalStatusRecord record = makeRecord(partition, row, jobHandle, resolvedName);
    if (!store_.insert(record)) {
        LOG_WARN("Status record for " + row.archiveId + " already exists; job " + jobHandle + " not recorded");
        return false;
    }
    LOG_TRACE("Recorded " + row.archiveId + " -> " + resolvedName + " (" + std::to_string(record.chunkCount) + " chunks)");
    return true;
}

}
