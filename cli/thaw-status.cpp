/*
 * thaw - Status lookup tool (thaw-status)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "thaw/config.hpp"
#include "thaw/partition_cursor.hpp"
#include "thaw/status_store.hpp"
#include "thaw/logger.hpp"
#include <cstdlib>
#include <iostream>

using namespace thaw;

void printUsage(const char* progName) {
    std::cout << "thaw Status Lookup Tool\n\n";
    std::cout << "Usage: " << progName << " <archive-id>\n";
    std::cout << "       " << progName << " --partition <pid>\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  THAW_STATUS_DIR    Status store directory (default ./status)\n";
    std::cout << "  THAW_LOG_LEVEL     Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " --partition 7\n";
    std::cout << "  THAW_STATUS_DIR=/var/lib/thaw " << progName << " <archive-id>\n";
}

int main(int argc, char* argv[]) {
    // Silence logs for CLI tool usage
    if (!std::getenv("THAW_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    if (argc < 2 || std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help") {
        printUsage(argv[0]);
        return argc < 2 ? 1 : 0;
    }

    try {
        Config config = Config::fromEnv();
        FileStatusStore store(config.statusDir, false);

        if (std::string(argv[1]) == "--partition") {
            if (argc < 3) {
                printUsage(argv[0]);
                return 1;
            }
            PartitionId partition = std::stoll(argv[2]);
            PartitionCursor cursor(store);
            auto rows = store.listPartition(partition);
            std::cout << "partition " << partition << "\n";
            std::cout << "  last row   " << cursor.maxProcessed(partition) << "\n";
            std::cout << "  records    " << rows.size() << "\n";
            return 0;
        }

        auto record = store.get(argv[1]);
        if (!record) {
            std::cerr << "No status record for: " << argv[1] << std::endl;
            return 2;
        }
        std::cout << serializeRecord(*record);
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
