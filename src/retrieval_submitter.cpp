/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "thaw/retrieval_submitter.hpp"
#include "thaw/retrieval_backend.hpp"
#include "thaw/errors.hpp"
#include "thaw/logger.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace thaw {

RetrievalSubmitter::RetrievalSubmitter(RetrievalBackend& backend, std::string tier, std::string notifyChannel) noexcept
    : backend_(backend), tier_(std::move(tier)), notifyChannel_(std::move(notifyChannel)) {
}

JobHandle RetrievalSubmitter::submit(const ArchiveId& archiveId) {
    if (archiveId.empty()) {
        throw std::invalid_argument("archive id is empty");
    }
    if (std::any_of(archiveId.begin(), archiveId.end(), [](unsigned char c) { return std::isspace(c) || std::iscntrl(c); })) {
        throw std::invalid_argument("archive id contains whitespace or control characters: " + archiveId);
    }

    JobHandle handle = backend_.submitJob(archiveId, tier_, notifyChannel_);
    if (handle.empty()) {
        throw ExternalFailure("backend returned no job handle for " + archiveId);
    }

    ++submitted_;
    LOG_DEBUG("Retrieval job " + handle + " started for " + archiveId + " (" + tier_ + ")");
    return handle;
}

}
