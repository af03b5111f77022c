/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "thaw/types.hpp"

namespace thaw {

const char* queryStateToString(QueryState state) noexcept {
    switch (state) {
        case QueryState::Queued: return "QUEUED";
        case QueryState::Running: return "RUNNING";
        case QueryState::Succeeded: return "SUCCEEDED";
        case QueryState::Failed: return "FAILED";
        case QueryState::Cancelled: return "CANCELLED";
        case QueryState::Missing: return "MISSING";
        default: return "UNKNOWN";
    }
}

}
