/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>
#include <unordered_set>

#include "thaw/types.hpp"

namespace thaw {

class StatusStore;

// Derives the target file name from an archive description.
//   empty description          -> 00_undefined/<archiveId>
//   <m>..<p>base64</p>..</m>   -> decoded path (FastGlacier / CloudBerry)
//   {"Path":"..."}             -> path member
//   anything else              -> trimmed description
[[nodiscard]] std::string parseFileName(const ArchiveId& archiveId, const std::string& description);

// Assigns names unique against this run and against persisted records.
// Uniqueness is best-effort: concurrent runs can still race on the
// secondary index.
class NameResolver {
public:
    explicit NameResolver(const StatusStore& store) noexcept : store_(store) {}

    NameResolver(const NameResolver&) = delete;
    NameResolver& operator=(const NameResolver&) = delete;

    [[nodiscard]] std::string resolve(const ArchiveId& archiveId, const std::string& description,
                                      const std::string& creationTimestamp);

    // Names handed out by this resolver so far.
    [[nodiscard]] const std::unordered_set<std::string>& seen() const noexcept { return seen_; }
    [[nodiscard]] std::size_t renamed() const noexcept { return renamed_; }

private:
    const StatusStore& store_;
    std::unordered_set<std::string> seen_;
    std::size_t renamed_ = 0;
};

}
