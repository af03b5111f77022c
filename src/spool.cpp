/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "thaw/spool.hpp"
#include "thaw/logger.hpp"
#include <atomic>
#include <chrono>
#include <fstream>
#include <iterator>
#include <sstream>
#include <unistd.h>

namespace thaw {

namespace {
bool isPlainFileName(const std::string& name) {
    return !name.empty() && name != "." && name != ".." && name.find('/') == std::string::npos;
}

std::optional<std::string> slurp(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}
}

Spool::Spool(const std::filesystem::path& workspace, bool createIfMissing)
    : workspace_(workspace) {
    ready_ = createWorkspace(createIfMissing);
    if (!ready_) {
        LOG_ERROR("Failed to initialize spool workspace: " + workspace_.string());
    }
}

PublishResult Spool::publish(const SpoolFiles& files) {
    if (!ready_) {
        return {false, "", PublishError::WorkspaceError, "Spool workspace unavailable: " + workspace_.string()};
    }
    if (files.empty()) {
        return {false, "", PublishError::InvalidContent, "Nothing to publish"};
    }
    for (const auto& file : files) {
        if (!isPlainFileName(file.first)) {
            return {false, "", PublishError::InvalidContent, "Invalid spool file name: " + file.first};
        }
    }

    SpoolId id = generateId();
    LOG_TRACE("Generated spool id: " + id);

    std::error_code ec;
    std::filesystem::create_directories(workspace_ / "input" / "writing" / id, ec);
    if (ec) {
        LOG_ERROR("Failed to create spool directory for " + id + ": " + ec.message());
        return {false, "", PublishError::IoError, "Failed to create spool directory"};
    }

    for (const auto& file : files) {
        if (!writeFile(id, file.first, file.second)) {
            LOG_ERROR("Failed to write " + file.first + " for: " + id);
            cleanupFailed(id);
            return {false, "", PublishError::IoError, "Failed to write " + file.first};
        }
    }

    if (!atomicPublish(id)) {
        LOG_ERROR("Failed to publish spool entry: " + id);
        cleanupFailed(id);
        return {false, "", PublishError::IoError, "Failed to publish"};
    }

    LOG_DEBUG("Published " + id + " to " + workspace_.string());
    return {true, id, PublishError::None, ""};
}

SpoolStatus Spool::status(const SpoolId& id) const noexcept {
    try {
        if (id.empty()) {
            return SpoolStatus::Missing;
        }
        if (std::filesystem::exists(workspace_ / "output" / id)) {
            return SpoolStatus::Done;
        }
        if (std::filesystem::exists(workspace_ / "failed" / id)) {
            return SpoolStatus::Failed;
        }
        if (std::filesystem::exists(workspace_ / "processing" / id)) {
            return SpoolStatus::Running;
        }
        if (std::filesystem::exists(workspace_ / "input" / "ready" / id)) {
            return SpoolStatus::Queued;
        }
        return SpoolStatus::Missing;
    } catch (...) {
        return SpoolStatus::Missing;
    }
}

std::optional<std::string> Spool::error(const SpoolId& id) const {
    return slurp(workspace_ / "failed" / id / "error.txt");
}

std::optional<std::string> Spool::readFile(const SpoolId& id, const std::string& name) const {
    if (!isPlainFileName(name)) {
        return std::nullopt;
    }
    for (const auto& phase : {"output", "failed", "processing", "input/ready"}) {
        auto path = workspace_ / phase / id / name;
        if (std::filesystem::exists(path)) {
            return slurp(path);
        }
    }
    return std::nullopt;
}

bool Spool::createWorkspace(bool createIfMissing) noexcept {
    try {
        if (!std::filesystem::exists(workspace_)) {
            if (!createIfMissing) {
                return false;
            }
            std::filesystem::create_directories(workspace_);
        }

        std::filesystem::create_directories(workspace_ / "input" / "writing");
        std::filesystem::create_directories(workspace_ / "input" / "ready");
        std::filesystem::create_directories(workspace_ / "processing");
        std::filesystem::create_directories(workspace_ / "output");
        std::filesystem::create_directories(workspace_ / "failed");

        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create spool workspace: " + std::string(e.what()));
        return false;
    }
}

SpoolId Spool::generateId() {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    std::stringstream ss;
    ss << now << "_" << getpid() << "_" << unique_counter;
    return ss.str();
}

bool Spool::writeFile(const SpoolId& id, const std::string& name, const std::string& content) const noexcept {
    try {
        auto path = workspace_ / "input" / "writing" / id / name;
        std::ofstream file(path, std::ios::binary);
        if (!file) return false;

        file << content;
        file.flush();
        file.close();

        return file.good();
    } catch (...) {
        return false;
    }
}

bool Spool::atomicPublish(const SpoolId& id) const noexcept {
    std::error_code ec;
    std::filesystem::rename(workspace_ / "input" / "writing" / id, workspace_ / "input" / "ready" / id, ec);
    return !ec;
}

void Spool::cleanupFailed(const SpoolId& id) const noexcept {
    std::error_code ec;
    std::filesystem::remove_all(workspace_ / "input" / "writing" / id, ec);
}

}
