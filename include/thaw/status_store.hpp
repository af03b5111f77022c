/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "thaw/types.hpp"

namespace thaw {

// Keyed store of retrieval status records. Primary key is the archive id;
// secondary lookups by (partition, row) and by resolved name. Writers on
// different partitions never coordinate.
class StatusStore {
public:
    virtual ~StatusStore() = default;

    // Creates the record unless one already exists for its archive id.
    // Returns false in that case. Throws ExternalFailure on I/O failure.
    [[nodiscard]] virtual bool insert(const RetrievalStatusRecord& record) = 0;

    // Rewrites the secondary entries of a stored record. Idempotent.
    virtual void reindex(const RetrievalStatusRecord& record) = 0;

    // Highest row sequence recorded for the partition, 0 if none.
    [[nodiscard]] virtual RowSeq maxRowSeq(PartitionId partition) const = 0;
    [[nodiscard]] virtual bool nameExists(const std::string& resolvedName) const = 0;
    [[nodiscard]] virtual std::optional<RetrievalStatusRecord> get(const ArchiveId& archiveId) const = 0;
    [[nodiscard]] virtual std::vector<RowSeq> listPartition(PartitionId partition) const = 0;
};

// Directory-backed store:
//   records/<key>                      primary record
//   by-partition/<pid>/<rowSeq:020>    archive id
//   by-name/<hex(name)>                archive id
class FileStatusStore final : public StatusStore {
public:
    // With createIfMissing false the tree must already exist and nothing
    // is created on disk.
    explicit FileStatusStore(const std::filesystem::path& root, bool createIfMissing = true);

    FileStatusStore(const FileStatusStore&) = delete;
    FileStatusStore& operator=(const FileStatusStore&) = delete;

    [[nodiscard]] bool insert(const RetrievalStatusRecord& record) override;
    void reindex(const RetrievalStatusRecord& record) override;
    [[nodiscard]] RowSeq maxRowSeq(PartitionId partition) const override;
    [[nodiscard]] bool nameExists(const std::string& resolvedName) const override;
    [[nodiscard]] std::optional<RetrievalStatusRecord> get(const ArchiveId& archiveId) const override;
    [[nodiscard]] std::vector<RowSeq> listPartition(PartitionId partition) const override;

private:
    std::filesystem::path root_;

    [[nodiscard]] std::filesystem::path recordPath(const ArchiveId& archiveId) const;
    [[nodiscard]] std::filesystem::path partitionDir(PartitionId partition) const;
    [[nodiscard]] std::filesystem::path namePath(const std::string& resolvedName) const;
    void writeIndexEntry(const std::filesystem::path& path, const std::string& content) const;
    [[nodiscard]] std::vector<RowSeq> readPartitionIndex(PartitionId partition) const;
};

// key=value lines, one field per line
[[nodiscard]] std::string serializeRecord(const RetrievalStatusRecord& record);
[[nodiscard]] RetrievalStatusRecord parseRecord(const std::string& text);

}
