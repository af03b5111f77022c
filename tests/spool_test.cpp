/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <fstream>

#include "test_support.hpp"
#include "thaw/query_service.hpp"
#include "thaw/retrieval_backend.hpp"
#include "thaw/spool.hpp"

namespace thaw {
namespace {

using testing::TempDir;

// Plays the external executor: moves an entry between phases.
void moveTo(const std::filesystem::path& workspace, const SpoolId& id, const std::string& from, const std::string& to) {
    std::filesystem::rename(workspace / from / id, workspace / to / id);
}

TEST(Spool, PublishesIntoReadyAtomically) {
    TempDir dir;
    Spool spool(dir.path() / "ws");
    ASSERT_TRUE(spool.ready());

    PublishResult result = spool.publish({{"a.txt", "alpha"}, {"b.txt", "beta"}});
    ASSERT_TRUE(result) << result.message;
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "ws" / "input" / "ready" / result.id / "a.txt"));
    EXPECT_TRUE(std::filesystem::is_empty(dir.path() / "ws" / "input" / "writing"));
    EXPECT_EQ(spool.status(result.id), SpoolStatus::Queued);
    EXPECT_EQ(spool.readFile(result.id, "b.txt"), std::optional<std::string>("beta"));
}

TEST(Spool, GeneratesDistinctIds) {
    TempDir dir;
    Spool spool(dir.path());
    auto first = spool.publish({{"f", "1"}});
    auto second = spool.publish({{"f", "2"}});
    ASSERT_TRUE(first && second);
    EXPECT_NE(first.id, second.id);
}

TEST(Spool, RejectsPathLikeFileNames) {
    TempDir dir;
    Spool spool(dir.path());
    auto result = spool.publish({{"../escape", "x"}});
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, PublishError::InvalidContent);
    EXPECT_FALSE(spool.publish({}));
}

TEST(Spool, MissingWorkspaceWithoutCreateIsUnavailable) {
    TempDir dir;
    Spool spool(dir.path() / "absent", false);
    EXPECT_FALSE(spool.ready());
    auto result = spool.publish({{"f", "x"}});
    EXPECT_EQ(result.error, PublishError::WorkspaceError);
}

TEST(Spool, StatusFollowsPhaseDirectories) {
    TempDir dir;
    auto ws = dir.path();
    Spool spool(ws);
    auto id = spool.publish({{"f", "x"}}).id;

    moveTo(ws, id, "input/ready", "processing");
    EXPECT_EQ(spool.status(id), SpoolStatus::Running);
    moveTo(ws, id, "processing", "failed");
    std::ofstream(ws / "failed" / id / "error.txt") << "boom";
    EXPECT_EQ(spool.status(id), SpoolStatus::Failed);
    EXPECT_EQ(spool.error(id), std::optional<std::string>("boom"));
    EXPECT_EQ(spool.status("no-such-id"), SpoolStatus::Missing);
}

TEST(SpoolQueryService, MapsPhasesToQueryStates) {
    TempDir dir;
    auto ws = dir.path() / "query";
    SpoolQueryService queries(ws, "inventorydb", "primary");

    QueryId id = queries.startQuery("select 1 where part=3", dir.path() / "staging");
    EXPECT_EQ(queries.pollStatus(id), QueryState::Queued);

    Spool view(ws, false);
    EXPECT_EQ(view.readFile(id, "query.sql"), std::optional<std::string>("select 1 where part=3"));
    EXPECT_EQ(view.readFile(id, "database.txt"), std::optional<std::string>("inventorydb"));

    moveTo(ws, id, "input/ready", "processing");
    EXPECT_EQ(queries.pollStatus(id), QueryState::Running);
    moveTo(ws, id, "processing", "output");
    EXPECT_EQ(queries.pollStatus(id), QueryState::Succeeded);
}

TEST(SpoolQueryService, CancelledErrorMapsToCancelledState) {
    TempDir dir;
    auto ws = dir.path() / "query";
    SpoolQueryService queries(ws, "db", "wg");
    QueryId id = queries.startQuery("select 1", dir.path() / "staging");
    moveTo(ws, id, "input/ready", "failed");
    std::ofstream(ws / "failed" / id / "error.txt") << "CANCELLED by user";
    EXPECT_EQ(queries.pollStatus(id), QueryState::Cancelled);
}

TEST(SpoolQueryService, OpensResultFromStagingLocation) {
    TempDir dir;
    auto staging = dir.path() / "staging";
    SpoolQueryService queries(dir.path() / "query", "db", "wg");
    QueryId id = queries.startQuery("select 1", staging);

    EXPECT_THROW((void)queries.openResult(id, staging), ExternalFailure);

    std::ofstream(resultPath(staging, id)) << "row_num\n1\n";
    auto in = queries.openResult(id, staging);
    std::string header;
    std::getline(*in, header);
    EXPECT_EQ(header, "row_num");
    EXPECT_EQ(resultPath(staging, id), staging / "results" / (id + ".csv"));
}

TEST(SpoolRetrievalBackend, WritesRetrievalJob) {
    TempDir dir;
    auto ws = dir.path() / "retrieval";
    SpoolRetrievalBackend backend(ws, "archive-vault");

    JobHandle job = backend.submitJob("AID-1", "Bulk", "topic-arn");
    ASSERT_FALSE(job.empty());

    Spool view(ws, false);
    auto text = view.readFile(job, "job.txt");
    ASSERT_TRUE(text.has_value());
    EXPECT_NE(text->find("type=archive-retrieval\n"), std::string::npos);
    EXPECT_NE(text->find("vault=archive-vault\n"), std::string::npos);
    EXPECT_NE(text->find("archiveId=AID-1\n"), std::string::npos);
    EXPECT_NE(text->find("tier=Bulk\n"), std::string::npos);
    EXPECT_NE(text->find("notify=topic-arn\n"), std::string::npos);
}

}
}
