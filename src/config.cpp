/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "thaw/config.hpp"
#include "thaw/errors.hpp"
#include "thaw/logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>

namespace thaw {

namespace {
std::string env_string(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    return val;
}

std::uint64_t env_u64(const char* name, std::uint64_t defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    std::string text(val);
    if (!std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw ConfigError(std::string(name) + " must be a non-negative integer, got '" + text + "'");
    }
    try {
        return static_cast<std::uint64_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        throw ConfigError(std::string(name) + " is out of range: " + text);
    }
}

bool env_flag(const char* name, bool defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    std::string text(val);
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "1" || text == "true" || text == "yes" || text == "on") return true;
    if (text == "0" || text == "false" || text == "no" || text == "off") return false;
    throw ConfigError(std::string(name) + " must be a boolean, got '" + val + "'");
}
}

bool isValidTier(const std::string& tier) noexcept {
    static const std::array<const char*, 3> tiers = {"Expedited", "Standard", "Bulk"};
    return std::any_of(tiers.begin(), tiers.end(), [&tier](const char* t) { return tier == t; });
}

Config Config::fromEnv() {
    Config config;
    config.chunkSize = env_u64("THAW_CHUNK_SIZE", config.chunkSize);
    config.pollInterval = std::chrono::seconds(
        env_u64("THAW_POLL_INTERVAL", std::chrono::duration_cast<std::chrono::seconds>(config.pollInterval).count()));
    config.queryTimeout = std::chrono::seconds(
        env_u64("THAW_QUERY_TIMEOUT", std::chrono::duration_cast<std::chrono::seconds>(config.queryTimeout).count()));
    config.tier = env_string("THAW_TIER", config.tier);
    config.notifyChannel = env_string("THAW_NOTIFY_CHANNEL", config.notifyChannel);
    config.vault = env_string("THAW_VAULT", config.vault);
    config.database = env_string("THAW_DATABASE", config.database);
    config.inventoryTable = env_string("THAW_INVENTORY_TABLE", config.inventoryTable);
    config.workgroup = env_string("THAW_WORKGROUP", config.workgroup);
    config.stagingDir = env_string("THAW_STAGING_DIR", config.stagingDir.string());
    config.statusDir = env_string("THAW_STATUS_DIR", config.statusDir.string());
    config.queryWorkspace = env_string("THAW_QUERY_WORKSPACE", config.queryWorkspace.string());
    config.retrievalWorkspace = env_string("THAW_RETRIEVAL_WORKSPACE", config.retrievalWorkspace.string());
    config.skipMalformedRows = env_flag("THAW_SKIP_MALFORMED", config.skipMalformedRows);

    std::uint64_t workers = env_u64("THAW_WORKERS", static_cast<std::uint64_t>(config.workers));
    if (workers > 256) {
        throw ConfigError("THAW_WORKERS must be at most 256");
    }
    config.workers = static_cast<int>(workers);

    LOG_DEBUG("Configuration loaded - database: " + config.database + ", table: " + config.inventoryTable +
              ", tier: " + config.tier + ", chunk size: " + std::to_string(config.chunkSize));
    return config;
}

void Config::validate() const {
    if (chunkSize == 0) {
        throw ConfigError("chunk size must be greater than zero");
    }
    if (pollInterval.count() <= 0) {
        throw ConfigError("poll interval must be greater than zero");
    }
    if (queryTimeout.count() < 0) {
        throw ConfigError("query timeout must not be negative");
    }
    if (!isValidTier(tier)) {
        throw ConfigError("unknown retrieval tier '" + tier + "' (expected Expedited, Standard or Bulk)");
    }
    if (database.empty()) {
        throw ConfigError("inventory database is not set (THAW_DATABASE)");
    }
    if (inventoryTable.empty()) {
        throw ConfigError("inventory table is not set (THAW_INVENTORY_TABLE)");
    }
    if (vault.empty()) {
        throw ConfigError("vault is not set (THAW_VAULT)");
    }
    if (notifyChannel.empty()) {
        throw ConfigError("notification channel is not set (THAW_NOTIFY_CHANNEL)");
    }
    if (workers < 1) {
        throw ConfigError("workers must be at least 1");
    }
}

}
