/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>

#include "thaw/config.hpp"
#include "thaw/types.hpp"

namespace thaw {

class CancelToken;
class QueryService;
class RetrievalBackend;
class StatusStore;

enum class DriverState : std::uint8_t {
    Init,
    Resuming,
    Streaming,
    RowSkip,
    RowProcess,
    Done,
    Failed
};

struct PartitionStats {
    std::size_t rows = 0;
    std::size_t skipped = 0;
    std::size_t submitted = 0;
    std::size_t renamed = 0;
    std::size_t malformed = 0;
    std::size_t alreadyRecorded = 0;
    std::size_t duplicateSubmissions = 0;
    std::size_t held = 0;
};

// Issues retrieval requests for every not yet recorded row of one
// partition, strictly in row order. Any failure aborts the whole
// invocation; re-running the same partition resumes after the last
// recorded row.
class PartitionDriver {
public:
    PartitionDriver(const Config& config, QueryService& queries, StatusStore& store,
                    RetrievalBackend& backend, const CancelToken* cancel = nullptr);

    PartitionDriver(const PartitionDriver&) = delete;
    PartitionDriver& operator=(const PartitionDriver&) = delete;

    // Processes pointer.nextPartition and returns the pointer advanced by one.
    // On failure the exception propagates and nothing is advanced.
    [[nodiscard]] PartitionPointer run(const PartitionPointer& pointer);

    [[nodiscard]] DriverState state() const noexcept { return state_; }
    [[nodiscard]] const PartitionStats& stats() const noexcept { return stats_; }

private:
    const Config& config_;
    QueryService& queries_;
    StatusStore& store_;
    RetrievalBackend& backend_;
    const CancelToken* cancel_;

    DriverState state_ = DriverState::Init;
    PartitionStats stats_;

    void processPartition(PartitionId partition);
};

const char* driverStateToString(DriverState state) noexcept;

}
