/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace thaw {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Query engine, job backend or status store unavailable or in a failed state.
class ExternalFailure : public Error {
public:
    explicit ExternalFailure(const std::string& what) : Error(what) {}
};

// Malformed inventory data. line() is 0 when unknown.
class DataAnomaly : public Error {
public:
    explicit DataAnomaly(const std::string& what, std::size_t line = 0)
        : Error(line ? what + " (line " + std::to_string(line) + ")" : what), line_(line) {}

    [[nodiscard]] std::size_t line() const noexcept { return line_; }

private:
    std::size_t line_;
};

class Cancelled : public Error {
public:
    explicit Cancelled(const std::string& what) : Error(what) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& what) : Error(what) {}
};

} // namespace thaw
