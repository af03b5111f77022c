/*
 * thaw - Retrieval request tool (thaw-request)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "thaw/cancel.hpp"
#include "thaw/config.hpp"
#include "thaw/errors.hpp"
#include "thaw/partition_driver.hpp"
#include "thaw/query_service.hpp"
#include "thaw/range_runner.hpp"
#include "thaw/retrieval_backend.hpp"
#include "thaw/status_store.hpp"
#include "thaw/logger.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace thaw;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "thaw Retrieval Request Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <next-partition> <max-partition> [options]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Requests retrieval of every inventory row of partitions next..max that\n";
    std::cout << "has no status record yet, and prints the advanced partition pointer.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -w, --workers <n>   Partitions processed concurrently (default THAW_WORKERS or 1)\n";
    std::cout << "  --skip-malformed    Log and skip malformed inventory rows instead of failing\n";
    std::cout << "  -h, --help          Show this help message\n";
    std::cout << "  -v, --version       Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  THAW_DATABASE, THAW_INVENTORY_TABLE, THAW_WORKGROUP   Inventory dataset\n";
    std::cout << "  THAW_VAULT, THAW_TIER, THAW_NOTIFY_CHANNEL            Retrieval jobs\n";
    std::cout << "  THAW_STAGING_DIR        Query output location\n";
    std::cout << "  THAW_STATUS_DIR         Status store directory\n";
    std::cout << "  THAW_QUERY_WORKSPACE    Query engine spool\n";
    std::cout << "  THAW_RETRIEVAL_WORKSPACE  Retrieval backend spool\n";
    std::cout << "  THAW_CHUNK_SIZE         Transfer chunk size in bytes\n";
    std::cout << "  THAW_POLL_INTERVAL, THAW_QUERY_TIMEOUT   Query polling, seconds\n";
    std::cout << "  THAW_LOG_LEVEL          Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
}

bool parsePartition(const std::string& text, PartitionId& out) {
    try {
        std::size_t pos = 0;
        long long value = std::stoll(text, &pos);
        if (pos != text.size()) {
            return false;
        }
        out = static_cast<PartitionId>(value);
        return true;
    } catch (...) {
        return false;
    }
}

int main(int argc, char* argv[]) {
    Logger::initFromEnv();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    PartitionPointer pointer;
    if (!parsePartition(argv[1], pointer.nextPartition) || !parsePartition(argv[2], pointer.maxPartition)) {
        std::cerr << "Error: partitions must be integers\n";
        return 1;
    }

    Config config;
    try {
        config = Config::fromEnv();
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-w" || arg == "--workers") && i + 1 < argc) {
            try {
                config.workers = std::stoi(argv[++i]);
            } catch (...) {
                std::cerr << "Error: Invalid worker count\n";
                return 1;
            }
        } else if (arg == "--skip-malformed") {
            config.skipMalformedRows = true;
        } else {
            std::cerr << "Error: Unknown option " << arg << "\n";
            return 1;
        }
    }

    try {
        config.validate();
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    setThreadName("Main");

    CancelToken cancel;
    std::thread signalWatcher([&cancel] {
        while (!cancel.cancelled()) {
            if (g_shutdown_requested) {
                LOG_WARN("Shutdown requested, cancelling");
                cancel.cancel();
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    int exitCode = 1;
    try {
        SpoolQueryService queries(config.queryWorkspace, config.database, config.workgroup);
        SpoolRetrievalBackend backend(config.retrievalWorkspace, config.vault);
        FileStatusStore store(config.statusDir);

        RangeRunner runner([&]() {
            return std::make_unique<PartitionDriver>(config, queries, store, backend, &cancel);
        }, config.workers, &cancel);

        RangeOutcome outcome = runner.run(pointer);

        std::cout << "{\"nextPartition\":" << outcome.pointer.nextPartition
                  << ",\"maxPartition\":" << outcome.pointer.maxPartition << "}" << std::endl;

        if (outcome.cancelled) {
            exitCode = 130;
        } else if (!outcome.failed.empty()) {
            std::string failed;
            for (PartitionId p : outcome.failed) {
                failed += (failed.empty() ? "" : ", ") + std::to_string(p);
            }
            LOG_ERROR("Failed partitions: " + failed);
            exitCode = 1;
        } else {
            exitCode = 0;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Retrieval request error: " + std::string(e.what()));
        exitCode = 1;
    }

    cancel.cancel();
    if (signalWatcher.joinable()) {
        signalWatcher.join();
    }
    return exitCode;
}
