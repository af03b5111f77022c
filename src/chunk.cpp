/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "thaw/chunk.hpp"
#include <stdexcept>

namespace thaw {

std::uint64_t chunkCount(std::uint64_t sizeBytes, std::uint64_t chunkSize) {
    if (chunkSize == 0) {
        throw std::invalid_argument("chunk size must be greater than zero");
    }
    std::uint64_t chunks = sizeBytes / chunkSize;
    if (sizeBytes % chunkSize != 0) {
        ++chunks;
    }
    return chunks;
}

}
