/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "test_support.hpp"
#include "thaw/status_store.hpp"

namespace thaw {
namespace {

using testing::TempDir;

RetrievalStatusRecord makeRecord(const ArchiveId& aid, PartitionId pid, RowSeq row, const std::string& name) {
    RetrievalStatusRecord record;
    record.archiveId = aid;
    record.jobHandle = "job-" + aid;
    record.partitionId = pid;
    record.rowSeq = row;
    record.contentHash = "abc123";
    record.sizeBytes = 2048;
    record.requestTimestamp = "2020-05-01T10:00:00+00:00";
    record.description = "line one\nline two \\ backslash";
    record.resolvedName = name;
    record.chunkCount = 2;
    return record;
}

TEST(FileStatusStore, EmptyPartitionHasCursorZero) {
    TempDir dir;
    FileStatusStore store(dir.path());
    EXPECT_EQ(store.maxRowSeq(7), 0);
    EXPECT_TRUE(store.listPartition(7).empty());
    EXPECT_FALSE(store.get("missing").has_value());
}

TEST(FileStatusStore, InsertAndReadBack) {
    TempDir dir;
    FileStatusStore store(dir.path());
    auto record = makeRecord("AID-1", 3, 12, "photos/cat.jpg");
    ASSERT_TRUE(store.insert(record));

    auto loaded = store.get("AID-1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->jobHandle, "job-AID-1");
    EXPECT_EQ(loaded->partitionId, 3);
    EXPECT_EQ(loaded->rowSeq, 12);
    EXPECT_EQ(loaded->sizeBytes, 2048u);
    EXPECT_EQ(loaded->description, record.description);
    EXPECT_EQ(loaded->resolvedName, "photos/cat.jpg");
    EXPECT_EQ(loaded->chunkCount, 2u);
    EXPECT_EQ(loaded->retryCount, 0u);
}

TEST(FileStatusStore, AtMostOneRecordPerArchive) {
    TempDir dir;
    FileStatusStore store(dir.path());
    ASSERT_TRUE(store.insert(makeRecord("AID-1", 1, 1, "a")));
    EXPECT_FALSE(store.insert(makeRecord("AID-1", 1, 2, "b")));
    EXPECT_EQ(store.get("AID-1")->resolvedName, "a");
    EXPECT_EQ(store.maxRowSeq(1), 1);
    EXPECT_FALSE(store.nameExists("b"));
}

TEST(FileStatusStore, MaxRowSeqIsPerPartition) {
    TempDir dir;
    FileStatusStore store(dir.path());
    ASSERT_TRUE(store.insert(makeRecord("A", 1, 5, "a")));
    ASSERT_TRUE(store.insert(makeRecord("B", 1, 40, "b")));
    ASSERT_TRUE(store.insert(makeRecord("C", 1, 9, "c")));
    ASSERT_TRUE(store.insert(makeRecord("D", 2, 100, "d")));

    EXPECT_EQ(store.maxRowSeq(1), 40);
    EXPECT_EQ(store.maxRowSeq(2), 100);
    EXPECT_EQ(store.listPartition(1), (std::vector<RowSeq>{5, 9, 40}));
}

TEST(FileStatusStore, NameLookupHandlesArbitraryNames) {
    TempDir dir;
    FileStatusStore store(dir.path());
    std::string longName(600, 'x');
    ASSERT_TRUE(store.insert(makeRecord("A", 1, 1, "dir/sub dir/é.txt")));
    ASSERT_TRUE(store.insert(makeRecord("B", 1, 2, longName)));

    EXPECT_TRUE(store.nameExists("dir/sub dir/é.txt"));
    EXPECT_TRUE(store.nameExists(longName));
    EXPECT_FALSE(store.nameExists("dir/sub dir"));
}

TEST(FileStatusStore, UnsafeArchiveIdsAreEncoded) {
    TempDir dir;
    FileStatusStore store(dir.path());
    ArchiveId odd = "../weird/id with spaces";
    ASSERT_TRUE(store.insert(makeRecord(odd, 1, 1, "n")));
    EXPECT_EQ(store.get(odd)->archiveId, odd);
    EXPECT_FALSE(store.insert(makeRecord(odd, 1, 2, "m")));
}

TEST(FileStatusStore, SurvivesReopen) {
    TempDir dir;
    {
        FileStatusStore store(dir.path());
        ASSERT_TRUE(store.insert(makeRecord("A", 4, 8, "name")));
    }
    FileStatusStore reopened(dir.path());
    EXPECT_EQ(reopened.maxRowSeq(4), 8);
    EXPECT_TRUE(reopened.nameExists("name"));
}

TEST(FileStatusStore, ReindexRestoresMissingEntries) {
    TempDir dir;
    FileStatusStore store(dir.path());
    auto record = makeRecord("A", 6, 3, "photo");
    ASSERT_TRUE(store.insert(record));
    std::filesystem::remove_all(dir.path() / "by-partition");
    std::filesystem::remove_all(dir.path() / "by-name");
    std::filesystem::create_directories(dir.path() / "by-name");
    ASSERT_EQ(store.maxRowSeq(6), 0);
    ASSERT_FALSE(store.nameExists("photo"));

    store.reindex(record);
    store.reindex(record);

    EXPECT_EQ(store.maxRowSeq(6), 3);
    EXPECT_EQ(store.listPartition(6), (std::vector<RowSeq>{3}));
    EXPECT_TRUE(store.nameExists("photo"));
}

TEST(FileStatusStore, ReadOnlyOpenCreatesNothing) {
    TempDir dir;
    auto root = dir.path() / "status";
    EXPECT_THROW(FileStatusStore(root, false), ExternalFailure);
    EXPECT_FALSE(std::filesystem::exists(root));

    {
        FileStatusStore writer(root);
        ASSERT_TRUE(writer.insert(makeRecord("A", 1, 1, "a")));
    }
    FileStatusStore reader(root, false);
    EXPECT_EQ(reader.maxRowSeq(1), 1);
    EXPECT_EQ(reader.get("A")->resolvedName, "a");
}

TEST(FileStatusStore, ConcurrentWritersOnDisjointPartitions) {
    TempDir dir;
    FileStatusStore store(dir.path());
    std::vector<std::thread> writers;
    for (int p = 0; p < 4; ++p) {
        writers.emplace_back([&store, p] {
            for (int row = 1; row <= 25; ++row) {
                std::string aid = "P" + std::to_string(p) + "R" + std::to_string(row);
                EXPECT_TRUE(store.insert(makeRecord(aid, p, row, aid)));
            }
        });
    }
    for (auto& t : writers) {
        t.join();
    }
    for (int p = 0; p < 4; ++p) {
        EXPECT_EQ(store.maxRowSeq(p), 25);
        EXPECT_EQ(store.listPartition(p).size(), 25u);
    }
}

TEST(RecordFormat, ParseRejectsRecordWithoutArchiveId) {
    EXPECT_THROW((void)parseRecord("pid=1\nifn=2\n"), ExternalFailure);
    EXPECT_THROW((void)parseRecord("aid=x\nifn=abc\n"), ExternalFailure);
}

}
}
