/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

#include "thaw/config.hpp"
#include "thaw/errors.hpp"
#include "thaw/query_service.hpp"
#include "thaw/retrieval_backend.hpp"
#include "thaw/types.hpp"

namespace thaw::testing {

// Fresh directory removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("thaw_test_" + std::to_string(getpid()) + "_" + std::to_string(counter.fetch_add(1)));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

struct Row {
    RowSeq rowSeq;
    std::uint64_t size;
    std::string archiveId;
    std::string description = "";
    std::string created = "2020-01-01T00:00:00.000Z";
};

inline std::string quote(const std::string& value) {
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out += '"';
        out += c;
    }
    return out + "\"";
}

// Query result in the engine's layout, every field quoted.
inline std::string inventoryCsv(const std::vector<Row>& rows) {
    std::ostringstream out;
    out << "\"row_num\",\"archiveid\",\"size\",\"sha256treehash\",\"creationdate\",\"archivedescription\"\n";
    for (const auto& row : rows) {
        out << quote(std::to_string(row.rowSeq)) << "," << quote(row.archiveId) << ","
            << quote(std::to_string(row.size)) << "," << quote("hash-" + row.archiveId) << ","
            << quote(row.created) << "," << quote(row.description) << "\n";
    }
    return out.str();
}

inline Config testConfig(const std::filesystem::path& root) {
    Config config;
    config.chunkSize = 1024;
    config.pollInterval = std::chrono::milliseconds(1);
    config.queryTimeout = std::chrono::milliseconds(0);
    config.tier = "Bulk";
    config.notifyChannel = "retrieval-topic";
    config.vault = "vault";
    config.database = "inventorydb";
    config.inventoryTable = "inventory_partitioned";
    config.stagingDir = root / "staging";
    config.statusDir = root / "status";
    config.queryWorkspace = root / "query";
    config.retrievalWorkspace = root / "retrieval";
    return config;
}

// Query engine answering from in-memory results keyed by partition.
class FakeQueryService final : public QueryService {
public:
    void setResult(PartitionId partition, std::string csv) {
        std::lock_guard<std::mutex> lock(mutex_);
        results_[partition] = std::move(csv);
    }

    // States returned by successive polls; the last one repeats.
    void setStates(PartitionId partition, std::vector<QueryState> states) {
        std::lock_guard<std::mutex> lock(mutex_);
        states_[partition] = std::move(states);
    }

    QueryId startQuery(const std::string& sql, const std::filesystem::path&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto pos = sql.find("part=");
        if (pos == std::string::npos) {
            throw ExternalFailure("query without partition filter");
        }
        PartitionId partition = std::stoll(sql.substr(pos + 5));
        QueryId id = "q" + std::to_string(++started_);
        queries_[id] = partition;
        polls_[id] = 0;
        sql_.push_back(sql);
        return id;
    }

    QueryState pollStatus(const QueryId& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = queries_.find(id);
        if (it == queries_.end()) {
            return QueryState::Missing;
        }
        auto states = states_.find(it->second);
        if (states == states_.end() || states->second.empty()) {
            return QueryState::Succeeded;
        }
        std::size_t index = polls_[id]++;
        return states->second[std::min(index, states->second.size() - 1)];
    }

    std::unique_ptr<std::istream> openResult(const QueryId& id, const std::filesystem::path&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = queries_.find(id);
        if (it == queries_.end()) {
            throw ExternalFailure("unknown query " + id);
        }
        auto result = results_.find(it->second);
        if (result == results_.end()) {
            throw ExternalFailure("no result for query " + id);
        }
        return std::make_unique<std::istringstream>(result->second);
    }

    [[nodiscard]] int started() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return started_;
    }

    [[nodiscard]] std::vector<std::string> sql() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sql_;
    }

private:
    mutable std::mutex mutex_;
    std::map<PartitionId, std::string> results_;
    std::map<PartitionId, std::vector<QueryState>> states_;
    std::map<QueryId, PartitionId> queries_;
    std::map<QueryId, std::size_t> polls_;
    std::vector<std::string> sql_;
    int started_ = 0;
};

// Retrieval backend that remembers every submission.
class FakeRetrievalBackend final : public RetrievalBackend {
public:
    struct Call {
        ArchiveId archiveId;
        std::string tier;
        std::string notifyChannel;
    };

    // Refuse every submission for this archive id.
    void failFor(const ArchiveId& archiveId) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_ = archiveId;
    }

    void clearFailure() {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_.clear();
    }

    JobHandle submitJob(const ArchiveId& archiveId, const std::string& tier,
                        const std::string& notifyChannel) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!failing_.empty() && archiveId == failing_) {
            throw ExternalFailure("throttled: " + archiveId);
        }
        calls_.push_back({archiveId, tier, notifyChannel});
        return "job-" + std::to_string(calls_.size());
    }

    [[nodiscard]] std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    [[nodiscard]] std::vector<ArchiveId> archiveIds() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ArchiveId> ids;
        for (const auto& call : calls_) {
            ids.push_back(call.archiveId);
        }
        return ids;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Call> calls_;
    ArchiveId failing_;
};

}
