/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "thaw/retrieval_backend.hpp"
#include "thaw/errors.hpp"
#include "thaw/logger.hpp"

namespace thaw {

SpoolRetrievalBackend::SpoolRetrievalBackend(const std::filesystem::path& workspace, std::string vault)
    : spool_(workspace), vault_(std::move(vault)) {
    LOG_DEBUG("Retrieval spool at " + workspace.string() + " for vault " + vault_);
}

JobHandle SpoolRetrievalBackend::submitJob(const ArchiveId& archiveId, const std::string& tier,
                                           const std::string& notifyChannel) {
    std::string job;
    job += "type=archive-retrieval\n";
    job += "vault=" + vault_ + "\n";
    job += "archiveId=" + archiveId + "\n";
    job += "tier=" + tier + "\n";
    job += "notify=" + notifyChannel + "\n";

    PublishResult result = spool_.publish({{"job.txt", job}});
    if (!result) {
        throw ExternalFailure("retrieval job for " + archiveId + " not accepted: " + result.message);
    }
    return result.id;
}

}
