/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace thaw {

// Process-wide settings, read once at startup and handed to components.
struct Config {
    std::uint64_t chunkSize = 4ULL * 1024 * 1024 * 1024;
    // Read from the environment in seconds
    std::chrono::milliseconds pollInterval{5 * 1000};
    std::chrono::milliseconds queryTimeout{30 * 60 * 1000}; // 0 = wait forever
    std::string tier = "Bulk";
    std::string notifyChannel;
    std::string vault;
    std::string database;
    std::string inventoryTable;
    std::string workgroup = "primary";
    std::filesystem::path stagingDir = "staging";
    std::filesystem::path statusDir = "status";
    std::filesystem::path queryWorkspace = "spool/query";
    std::filesystem::path retrievalWorkspace = "spool/retrieval";
    bool skipMalformedRows = false;
    int workers = 1;

    [[nodiscard]] static Config fromEnv();

    // Throws ConfigError describing the first invalid setting.
    void validate() const;
};

[[nodiscard]] bool isValidTier(const std::string& tier) noexcept;

} // namespace thaw
