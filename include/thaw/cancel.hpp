/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>

namespace thaw {

// Shared stop flag checked at every blocking wait.
class CancelToken {
public:
    void cancel() noexcept { cancelled_.store(true); }
    [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(); }

    // Sleeps up to `duration` in short slices. Returns false if cancelled.
    bool sleepFor(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace thaw
