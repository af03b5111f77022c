/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <string>

#include "thaw/types.hpp"

namespace thaw {

class StatusStore;

// Persists the status record of a submitted row. Only call after the
// retrieval job was accepted.
class ProgressRecorder {
public:
    ProgressRecorder(StatusStore& store, std::uint64_t chunkSize) noexcept;

    // Returns false if a record for the archive already existed.
    bool record(PartitionId partition, const InventoryRow& row, const JobHandle& jobHandle,
                const std::string& resolvedName);

    [[nodiscard]] RetrievalStatusRecord makeRecord(PartitionId partition, const InventoryRow& row,
                                                   const JobHandle& jobHandle,
                                                   const std::string& resolvedName) const;

private:
    StatusStore& store_;
    std::uint64_t chunkSize_;
};

// YYYY-MM-DDTHH:MM:SS+HH:MM in local time
[[nodiscard]] std::string isoTimestamp(std::chrono::system_clock::time_point when);

}
