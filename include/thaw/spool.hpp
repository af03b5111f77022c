/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace thaw {

using SpoolId = std::string;

// Request lifecycle, derived from the phase directory holding the id.
enum class SpoolStatus : std::uint8_t { Queued, Running, Done, Failed, Missing };

enum class PublishError : std::uint8_t {
    None = 0,
    IoError,
    InvalidContent,
    WorkspaceError
};

struct PublishResult {
    bool ok = false;
    SpoolId id;
    PublishError error = PublishError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

using SpoolFiles = std::vector<std::pair<std::string, std::string>>;

// Directory-based request queue shared with an external executor:
//   input/writing/<id> -> input/ready/<id> -> processing/<id> -> output/<id> | failed/<id>
// This side writes and publishes requests and observes their phase; the
// executor claims, runs and finalizes them.
class Spool final {
public:
    explicit Spool(const std::filesystem::path& workspace, bool createIfMissing = true);

    Spool(const Spool&) = delete;
    Spool& operator=(const Spool&) = delete;
    Spool(Spool&&) noexcept = default;
    Spool& operator=(Spool&&) noexcept = default;

    // Writes each (filename, content) pair and publishes them atomically.
    [[nodiscard]] PublishResult publish(const SpoolFiles& files);

    [[nodiscard]] SpoolStatus status(const SpoolId& id) const noexcept;
    [[nodiscard]] std::optional<std::string> error(const SpoolId& id) const;
    [[nodiscard]] std::optional<std::string> readFile(const SpoolId& id, const std::string& name) const;

    [[nodiscard]] bool ready() const noexcept { return ready_; }

private:
    std::filesystem::path workspace_;
    bool ready_ = false;

    [[nodiscard]] bool createWorkspace(bool createIfMissing) noexcept;
    [[nodiscard]] static SpoolId generateId();
    [[nodiscard]] bool writeFile(const SpoolId& id, const std::string& name, const std::string& content) const noexcept;
    [[nodiscard]] bool atomicPublish(const SpoolId& id) const noexcept;
    void cleanupFailed(const SpoolId& id) const noexcept;
};

}
