/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <cstdlib>

#include "thaw/config.hpp"
#include "thaw/errors.hpp"

namespace thaw {
namespace {

class ConfigEnvTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const char* name : {"THAW_CHUNK_SIZE", "THAW_POLL_INTERVAL", "THAW_TIER", "THAW_DATABASE",
                                 "THAW_INVENTORY_TABLE", "THAW_SKIP_MALFORMED", "THAW_WORKERS",
                                 "THAW_STATUS_DIR"}) {
            unsetenv(name);
        }
    }
};

Config validConfig() {
    Config config;
    config.database = "db";
    config.inventoryTable = "inventory";
    config.vault = "vault";
    config.notifyChannel = "topic";
    return config;
}

TEST_F(ConfigEnvTest, DefaultsWhenUnset) {
    Config config = Config::fromEnv();
    EXPECT_EQ(config.chunkSize, 4ULL * 1024 * 1024 * 1024);
    EXPECT_EQ(config.pollInterval, std::chrono::seconds(5));
    EXPECT_EQ(config.tier, "Bulk");
    EXPECT_FALSE(config.skipMalformedRows);
    EXPECT_EQ(config.workers, 1);
}

TEST_F(ConfigEnvTest, ReadsOverrides) {
    setenv("THAW_CHUNK_SIZE", "1048576", 1);
    setenv("THAW_POLL_INTERVAL", "2", 1);
    setenv("THAW_TIER", "Standard", 1);
    setenv("THAW_SKIP_MALFORMED", "yes", 1);
    setenv("THAW_WORKERS", "4", 1);
    setenv("THAW_STATUS_DIR", "/var/lib/thaw", 1);

    Config config = Config::fromEnv();
    EXPECT_EQ(config.chunkSize, 1048576u);
    EXPECT_EQ(config.pollInterval, std::chrono::milliseconds(2000));
    EXPECT_EQ(config.tier, "Standard");
    EXPECT_TRUE(config.skipMalformedRows);
    EXPECT_EQ(config.workers, 4);
    EXPECT_EQ(config.statusDir, std::filesystem::path("/var/lib/thaw"));
}

TEST_F(ConfigEnvTest, MalformedNumberIsConfigError) {
    setenv("THAW_CHUNK_SIZE", "4GB", 1);
    EXPECT_THROW((void)Config::fromEnv(), ConfigError);
}

TEST(ConfigValidate, AcceptsCompleteConfig) {
    EXPECT_NO_THROW(validConfig().validate());
}

TEST(ConfigValidate, RejectsBadSettings) {
    Config config = validConfig();
    config.chunkSize = 0;
    EXPECT_THROW(config.validate(), ConfigError);

    config = validConfig();
    config.tier = "Glacial";
    EXPECT_THROW(config.validate(), ConfigError);

    config = validConfig();
    config.database.clear();
    EXPECT_THROW(config.validate(), ConfigError);

    config = validConfig();
    config.pollInterval = std::chrono::milliseconds(0);
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST(ConfigValidate, KnowsRetrievalTiers) {
    EXPECT_TRUE(isValidTier("Expedited"));
    EXPECT_TRUE(isValidTier("Standard"));
    EXPECT_TRUE(isValidTier("Bulk"));
    EXPECT_FALSE(isValidTier("bulk"));
}

}
}
