/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "thaw/inventory_reader.hpp"
#include "thaw/cancel.hpp"
#include "thaw/config.hpp"
#include "thaw/errors.hpp"
#include "thaw/query_service.hpp"
#include "thaw/logger.hpp"
#include <algorithm>
#include <cctype>
#include <thread>

namespace thaw {

namespace {
bool sameRow(const InventoryRow& a, const InventoryRow& b) {
    return a.rowSeq == b.rowSeq && a.archiveId == b.archiveId && a.sizeBytes == b.sizeBytes &&
           a.contentHash == b.contentHash && a.description == b.description &&
           a.creationTimestamp == b.creationTimestamp;
}

bool isBlankRecord(const std::vector<std::string>& fields) {
    return fields.size() == 1 && fields[0].empty();
}
}

std::int64_t parseNonNegative(const std::string& field, const char* column, std::size_t line) {
    if (field.empty() || !std::all_of(field.begin(), field.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw DataAnomaly(std::string("column ") + column + " is not a non-negative integer: '" + field + "'", line);
    }
    try {
        return static_cast<std::int64_t>(std::stoll(field));
    } catch (const std::out_of_range&) {
        throw DataAnomaly(std::string("column ") + column + " is out of range: '" + field + "'", line);
    }
}

RowStream::RowStream(std::unique_ptr<std::istream> in, bool skipMalformed)
    : in_(std::move(in)), reader_(std::make_unique<CsvReader>(*in_)), skipMalformed_(skipMalformed) {
}

void RowStream::readHeader() {
    auto header = reader_->next();
    if (!header) {
        throw DataAnomaly("query result is empty (no header row)", 1);
    }
    CsvHeader columns(*header);
    columns_ = Columns{
        columns.require("row_num"),
        columns.require("size"),
        columns.require("archiveid"),
        columns.require("sha256treehash"),
        columns.require("archivedescription"),
        columns.require("creationdate"),
    };
    width_ = columns.size();
}

InventoryRow RowStream::parseRow(const std::vector<std::string>& fields) const {
    const std::size_t line = reader_->line();
    if (fields.size() < width_) {
        throw DataAnomaly("row has " + std::to_string(fields.size()) + " fields, expected " + std::to_string(width_), line);
    }

    InventoryRow row;
    row.rowSeq = parseNonNegative(fields[columns_->rowNum], "row_num", line);
    row.sizeBytes = static_cast<std::uint64_t>(parseNonNegative(fields[columns_->size], "size", line));
    row.archiveId = fields[columns_->archiveId];
    row.contentHash = fields[columns_->hash];
    row.description = fields[columns_->description];
    row.creationTimestamp = fields[columns_->creationDate];

    if (row.archiveId.empty()) {
        throw DataAnomaly("row " + std::to_string(row.rowSeq) + " has no archive id", line);
    }
    return row;
}

std::optional<InventoryRow> RowStream::next() {
    if (!columns_) {
        readHeader();
    }

    while (auto fields = reader_->next()) {
        if (isBlankRecord(*fields)) {
            continue;
        }

        InventoryRow row;
        try {
            row = parseRow(*fields);
        } catch (const DataAnomaly& e) {
            if (!skipMalformed_) {
                throw;
            }
            ++malformed_;
            LOG_WARN(std::string("Skipping malformed inventory row: ") + e.what());
            continue;
        }

        if (previous_) {
            if (sameRow(*previous_, row)) {
                ++duplicates_;
                LOG_TRACE("Dropping duplicate row " + std::to_string(row.rowSeq));
                continue;
            }
            if (row.rowSeq < previous_->rowSeq) {
                throw DataAnomaly("row sequence went backwards: " + std::to_string(row.rowSeq) +
                                  " after " + std::to_string(previous_->rowSeq), reader_->line());
            }
        }

        previous_ = row;
        return row;
    }
    return std::nullopt;
}

InventoryReader::InventoryReader(QueryService& queries, const Config& config, const CancelToken* cancel)
    : queries_(queries),
      database_(config.database),
      table_(config.inventoryTable),
      stagingDir_(config.stagingDir),
      pollInterval_(config.pollInterval),
      queryTimeout_(config.queryTimeout),
      skipMalformed_(config.skipMalformedRows),
      cancel_(cancel) {
}

std::string InventoryReader::buildQuery(PartitionId partition) const {
    return "select distinct row_num, archiveid, \"size\", sha256treehash, creationdate, archivedescription from \"" +
           database_ + "\".\"" + table_ + "\" where part=" + std::to_string(partition) + " order by row_num";
}

RowStream InventoryReader::streamPartition(PartitionId partition) {
    LOG_DEBUG("Starting inventory query for partition " + std::to_string(partition));
    QueryId id = queries_.startQuery(buildQuery(partition), stagingDir_);
    lastQueryId_ = id;
    LOG_INFO("Query id: " + id);

    awaitCompletion(id);

    LOG_DEBUG("Reading query result " + resultPath(stagingDir_, id).string());
    return RowStream(queries_.openResult(id, stagingDir_), skipMalformed_);
}

void InventoryReader::awaitCompletion(const QueryId& id) {
    const auto started = std::chrono::steady_clock::now();

    while (true) {
        LOG_DEBUG("Waiting for query " + id + " to complete");
        if (cancel_) {
            if (!cancel_->sleepFor(pollInterval_)) {
                throw Cancelled("cancelled while waiting for query " + id);
            }
        } else {
            std::this_thread::sleep_for(pollInterval_);
        }

        QueryState state = queries_.pollStatus(id);
        switch (state) {
            case QueryState::Succeeded:
                return;
            case QueryState::Queued:
            case QueryState::Running:
                break;
            default:
                LOG_ERROR("Query " + id + " ended in state " + queryStateToString(state));
                throw ExternalFailure("query " + id + " ended in state " + queryStateToString(state));
        }

        if (queryTimeout_.count() > 0 && std::chrono::steady_clock::now() - started >= queryTimeout_) {
            throw ExternalFailure("query " + id + " still " + queryStateToString(state) + " after " +
                                  std::to_string(queryTimeout_.count() / 1000) + "s");
        }
    }
}

}
