/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "thaw/cancel.hpp"
#include <algorithm>
#include <thread>

namespace thaw {

bool CancelToken::sleepFor(std::chrono::milliseconds duration) const {
    const auto slice = std::chrono::milliseconds(100);
    auto sleepEnd = std::chrono::steady_clock::now() + duration;
    while (!cancelled()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= sleepEnd) {
            return true;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(sleepEnd - now);
        std::this_thread::sleep_for(std::min(slice, remaining));
    }
    return false;
}

}
