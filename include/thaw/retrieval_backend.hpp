/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>

#include "thaw/spool.hpp"
#include "thaw/types.hpp"

namespace thaw {

// Cold-storage backend accepting asynchronous retrieval jobs. Every call
// starts billable, rate-limited work.
class RetrievalBackend {
public:
    virtual ~RetrievalBackend() = default;

    // Throws ExternalFailure when the job is not accepted.
    [[nodiscard]] virtual JobHandle submitJob(const ArchiveId& archiveId, const std::string& tier,
                                              const std::string& notifyChannel) = 0;
};

class SpoolRetrievalBackend final : public RetrievalBackend {
public:
    SpoolRetrievalBackend(const std::filesystem::path& workspace, std::string vault);

    [[nodiscard]] JobHandle submitJob(const ArchiveId& archiveId, const std::string& tier,
                                      const std::string& notifyChannel) override;

private:
    Spool spool_;
    std::string vault_;
};

}
