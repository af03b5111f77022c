/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "thaw/partition_driver.hpp"
#include "thaw/cancel.hpp"
#include "thaw/errors.hpp"
#include "thaw/inventory_reader.hpp"
#include "thaw/name_resolver.hpp"
#include "thaw/partition_cursor.hpp"
#include "thaw/progress_recorder.hpp"
#include "thaw/retrieval_submitter.hpp"
#include "thaw/status_store.hpp"
#include "thaw/logger.hpp"

namespace thaw {

PartitionDriver::PartitionDriver(const Config& config, QueryService& queries, StatusStore& store,
                                 RetrievalBackend& backend, const CancelToken* cancel)
    : config_(config), queries_(queries), store_(store), backend_(backend), cancel_(cancel) {
}

PartitionPointer PartitionDriver::run(const PartitionPointer& pointer) {
    state_ = DriverState::Init;
    stats_ = PartitionStats{};
    const PartitionId partition = pointer.nextPartition;

    LOG_INFO("Starting partition: " + std::to_string(partition) + ". Last partition: " +
             std::to_string(pointer.maxPartition));

    try {
        processPartition(partition);
    } catch (const std::exception& e) {
        LOG_ERROR("Partition " + std::to_string(partition) + " failed in " + driverStateToString(state_) +
                  " after " + std::to_string(stats_.submitted) + " submissions: " + e.what());
        state_ = DriverState::Failed;
        throw;
    }

    state_ = DriverState::Done;
    LOG_INFO("Partition " + std::to_string(partition) + " done: " + std::to_string(stats_.rows) + " rows, " +
             std::to_string(stats_.submitted) + " submitted, " + std::to_string(stats_.skipped) + " skipped, " +
             std::to_string(stats_.renamed) + " renamed");

    PartitionPointer next = pointer;
    next.nextPartition = partition + 1;
    return next;
}

void PartitionDriver::processPartition(PartitionId partition) {
    state_ = DriverState::Resuming;
    PartitionCursor cursor(store_);
    RowSeq lastProcessed = cursor.maxProcessed(partition);
    LOG_INFO("Max processed row number: " + std::to_string(lastProcessed));

    state_ = DriverState::Streaming;
    InventoryReader reader(queries_, config_, cancel_);
    RowStream rows = reader.streamPartition(partition);

    NameResolver names(store_);
    RetrievalSubmitter submitter(backend_, config_.tier, config_.notifyChannel);
    ProgressRecorder recorder(store_, config_.chunkSize);

    while (auto row = rows.next()) {
        ++stats_.rows;

        if (row->rowSeq <= lastProcessed) {
            state_ = DriverState::RowSkip;
            ++stats_.skipped;
            continue;
        }

        // A skipped malformed row lies before this one. Recording past it
        // would move the cursor over a row that was never submitted.
        if (rows.malformed() > 0) {
            state_ = DriverState::RowSkip;
            ++stats_.held;
            continue;
        }

        if (cancel_ && cancel_->cancelled()) {
            throw Cancelled("cancelled before row " + std::to_string(row->rowSeq) + " of partition " +
                            std::to_string(partition));
        }

        state_ = DriverState::RowProcess;
        LOG_INFO(std::to_string(row->rowSeq) + " : " + row->archiveId);

        // A lagging cursor, or an insert interrupted before its index
        // entries were written, hands back rows that already have a record
        if (auto existing = store_.get(row->archiveId)) {
            LOG_WARN("Archive " + row->archiveId + " already has a status record, not resubmitting");
            store_.reindex(*existing);
            ++stats_.alreadyRecorded;
            lastProcessed = row->rowSeq;
            continue;
        }

        std::string name = names.resolve(row->archiveId, row->description, row->creationTimestamp);
        LOG_INFO(name);

        JobHandle job = submitter.submit(row->archiveId);
        if (recorder.record(partition, *row, job, name)) {
            ++stats_.submitted;
        } else {
            // Another run recorded the archive between the check and the insert
            ++stats_.duplicateSubmissions;
        }
        lastProcessed = row->rowSeq;
    }

    stats_.renamed = names.renamed();
    stats_.malformed = rows.malformed();

    if (stats_.malformed > 0) {
        throw DataAnomaly(std::to_string(stats_.malformed) + " malformed rows in partition " +
                          std::to_string(partition) + ", " + std::to_string(stats_.held) +
                          " later rows held back; fix the inventory and re-run");
    }
}

const char* driverStateToString(DriverState state) noexcept {
    switch (state) {
        case DriverState::Init: return "INIT";
        case DriverState::Resuming: return "RESUMING";
        case DriverState::Streaming: return "STREAMING";
        case DriverState::RowSkip: return "ROW_SKIP";
        case DriverState::RowProcess: return "ROW_PROCESS";
        case DriverState::Done: return "DONE";
        case DriverState::Failed: return "FAILED";
        default: return "UNKNOWN";
    }
}

}
