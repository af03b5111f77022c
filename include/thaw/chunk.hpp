/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>

namespace thaw {

// Number of fixed-size transfer chunks needed for an object of sizeBytes.
// Zero only for an empty object. Throws std::invalid_argument on chunkSize 0.
[[nodiscard]] std::uint64_t chunkCount(std::uint64_t sizeBytes, std::uint64_t chunkSize);

}
