/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace thaw {

// RFC 4180 record reader: quoted fields, doubled quotes, CRLF or LF.
class CsvReader {
public:
    explicit CsvReader(std::istream& in) noexcept : in_(in) {}

    // Next record, or nullopt at end of input. Throws DataAnomaly on an
    // unterminated quoted field.
    [[nodiscard]] std::optional<std::vector<std::string>> next();

    // Line on which the last returned record started (1-based).
    [[nodiscard]] std::size_t line() const noexcept { return recordLine_; }

private:
    std::istream& in_;
    std::size_t currentLine_ = 1;
    std::size_t recordLine_ = 0;
};

// Maps header names to column positions.
class CsvHeader {
public:
    explicit CsvHeader(const std::vector<std::string>& names);

    // Throws DataAnomaly if the column is absent.
    [[nodiscard]] std::size_t require(const std::string& name) const;
    [[nodiscard]] std::size_t size() const noexcept { return width_; }

private:
    std::unordered_map<std::string, std::size_t> index_;
    std::size_t width_;
};

}
