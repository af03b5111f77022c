/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "thaw/query_service.hpp"
#include "thaw/errors.hpp"
#include "thaw/logger.hpp"
#include <fstream>

namespace thaw {

std::filesystem::path resultPath(const std::filesystem::path& outputLocation, const QueryId& id) {
    return outputLocation / "results" / (id + ".csv");
}

SpoolQueryService::SpoolQueryService(const std::filesystem::path& workspace, std::string database, std::string workgroup)
    : spool_(workspace), database_(std::move(database)), workgroup_(std::move(workgroup)) {
    LOG_DEBUG("Query spool at " + workspace.string() + " (database: " + database_ + ", workgroup: " + workgroup_ + ")");
}

QueryId SpoolQueryService::startQuery(const std::string& sql, const std::filesystem::path& outputLocation) {
    if (sql.empty()) {
        throw std::invalid_argument("query text is empty");
    }

    std::error_code ec;
    std::filesystem::create_directories(outputLocation / "results", ec);
    if (ec) {
        throw ExternalFailure("cannot prepare query output location " + outputLocation.string() + ": " + ec.message());
    }

    PublishResult result = spool_.publish({
        {"query.sql", sql},
        {"database.txt", database_},
        {"workgroup.txt", workgroup_},
        {"output.txt", std::filesystem::absolute(outputLocation).string()},
    });
    if (!result) {
        throw ExternalFailure("failed to start query: " + result.message);
    }
    return result.id;
}

QueryState SpoolQueryService::pollStatus(const QueryId& id) {
    switch (spool_.status(id)) {
        case SpoolStatus::Queued: return QueryState::Queued;
        case SpoolStatus::Running: return QueryState::Running;
        case SpoolStatus::Done: return QueryState::Succeeded;
        case SpoolStatus::Failed: {
            auto reason = spool_.error(id);
            if (reason && reason->rfind("CANCELLED", 0) == 0) {
                return QueryState::Cancelled;
            }
            return QueryState::Failed;
        }
        case SpoolStatus::Missing:
        default:
            return QueryState::Missing;
    }
}

std::unique_ptr<std::istream> SpoolQueryService::openResult(const QueryId& id, const std::filesystem::path& outputLocation) {
    auto path = resultPath(outputLocation, id);
    auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!*file) {
        throw ExternalFailure("query result not found: " + path.string());
    }
    return file;
}

}
