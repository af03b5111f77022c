/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <istream>
#include <memory>
#include <string>

#include "thaw/spool.hpp"
#include "thaw/types.hpp"

namespace thaw {

// External tabular query engine.
class QueryService {
public:
    virtual ~QueryService() = default;

    // Throws ExternalFailure if the query cannot be started.
    [[nodiscard]] virtual QueryId startQuery(const std::string& sql, const std::filesystem::path& outputLocation) = 0;
    [[nodiscard]] virtual QueryState pollStatus(const QueryId& id) = 0;

    // Result of a succeeded query: <outputLocation>/results/<id>.csv
    [[nodiscard]] virtual std::unique_ptr<std::istream> openResult(const QueryId& id, const std::filesystem::path& outputLocation) = 0;
};

[[nodiscard]] std::filesystem::path resultPath(const std::filesystem::path& outputLocation, const QueryId& id);

// Hands queries to an external engine through a spool directory.
class SpoolQueryService final : public QueryService {
public:
    SpoolQueryService(const std::filesystem::path& workspace, std::string database, std::string workgroup);

    [[nodiscard]] QueryId startQuery(const std::string& sql, const std::filesystem::path& outputLocation) override;
    [[nodiscard]] QueryState pollStatus(const QueryId& id) override;
    [[nodiscard]] std::unique_ptr<std::istream> openResult(const QueryId& id, const std::filesystem::path& outputLocation) override;

private:
    Spool spool_;
    std::string database_;
    std::string workgroup_;
};

}
