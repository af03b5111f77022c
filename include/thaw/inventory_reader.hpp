/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "thaw/csv.hpp"
#include "thaw/types.hpp"

namespace thaw {

class CancelToken;
class QueryService;
struct Config;

// Lazy, ascending sequence of inventory rows parsed from a query result.
class RowStream {
public:
    RowStream(std::unique_ptr<std::istream> in, bool skipMalformed);

    RowStream(const RowStream&) = delete;
    RowStream& operator=(const RowStream&) = delete;
    RowStream(RowStream&&) noexcept = default;
    RowStream& operator=(RowStream&&) noexcept = default;

    // Next distinct row, or nullopt when the result is exhausted.
    // Throws DataAnomaly on malformed input or a decreasing row sequence.
    [[nodiscard]] std::optional<InventoryRow> next();

    [[nodiscard]] std::size_t malformed() const noexcept { return malformed_; }
    [[nodiscard]] std::size_t duplicates() const noexcept { return duplicates_; }

private:
    struct Columns {
        std::size_t rowNum;
        std::size_t size;
        std::size_t archiveId;
        std::size_t hash;
        std::size_t description;
        std::size_t creationDate;
    };

    std::unique_ptr<std::istream> in_;
    std::unique_ptr<CsvReader> reader_;
    std::optional<Columns> columns_;
    std::size_t width_ = 0;
    std::optional<InventoryRow> previous_;
    bool skipMalformed_;
    std::size_t malformed_ = 0;
    std::size_t duplicates_ = 0;

    void readHeader();
    [[nodiscard]] InventoryRow parseRow(const std::vector<std::string>& fields) const;
};

// Runs the partition query on the external engine and streams its result.
class InventoryReader {
public:
    InventoryReader(QueryService& queries, const Config& config, const CancelToken* cancel = nullptr);

    InventoryReader(const InventoryReader&) = delete;
    InventoryReader& operator=(const InventoryReader&) = delete;

    // One query execution per call. Throws ExternalFailure if the query does
    // not succeed within the configured ceiling, Cancelled if the token fires.
    [[nodiscard]] RowStream streamPartition(PartitionId partition);

    [[nodiscard]] std::string buildQuery(PartitionId partition) const;

    [[nodiscard]] const QueryId& lastQueryId() const noexcept { return lastQueryId_; }

private:
    QueryService& queries_;
    std::string database_;
    std::string table_;
    std::filesystem::path stagingDir_;
    std::chrono::milliseconds pollInterval_;
    std::chrono::milliseconds queryTimeout_;
    bool skipMalformed_;
    const CancelToken* cancel_;
    QueryId lastQueryId_;

    void awaitCompletion(const QueryId& id);
};

// Decimal digits only; throws DataAnomaly otherwise.
[[nodiscard]] std::int64_t parseNonNegative(const std::string& field, const char* column, std::size_t line);

}
