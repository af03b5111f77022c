/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <string>

#include "thaw/types.hpp"

namespace thaw {

class RetrievalBackend;

// Requests one asynchronous retrieval per archive with a fixed tier and
// notification channel. Must never be called twice for a recorded archive.
class RetrievalSubmitter {
public:
    RetrievalSubmitter(RetrievalBackend& backend, std::string tier, std::string notifyChannel) noexcept;

    // Throws std::invalid_argument on an empty archive id, ExternalFailure
    // if the backend refuses or returns no handle.
    [[nodiscard]] JobHandle submit(const ArchiveId& archiveId);

    [[nodiscard]] std::size_t submitted() const noexcept { return submitted_; }

private:
    RetrievalBackend& backend_;
    std::string tier_;
    std::string notifyChannel_;
    std::size_t submitted_ = 0;
};

}
