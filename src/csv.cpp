/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "thaw/csv.hpp"
#include "thaw/errors.hpp"

namespace thaw {

std::optional<std::vector<std::string>> CsvReader::next() {
    std::vector<std::string> fields;
    std::string field;
    bool inQuotes = false;
    bool any = false;
    recordLine_ = currentLine_;

    int ch;
    while ((ch = in_.get()) != std::char_traits<char>::eof()) {
        any = true;
        char c = static_cast<char>(ch);

        if (inQuotes) {
            if (c == '"') {
                if (in_.peek() == '"') {
                    in_.get();
                    field += '"';
                } else {
                    inQuotes = false;
                }
            } else {
                if (c == '\n') ++currentLine_;
                field += c;
            }
            continue;
        }

        if (c == '"') {
            inQuotes = true;
        } else if (c == ',') {
            fields.push_back(std::move(field));
            field.clear();
        } else if (c == '\r') {
            // CRLF handled by the '\n' branch; a lone CR is dropped
        } else if (c == '\n') {
            ++currentLine_;
            fields.push_back(std::move(field));
            return fields;
        } else {
            field += c;
        }
    }

    if (inQuotes) {
        throw DataAnomaly("unterminated quoted field", recordLine_);
    }
    if (!any) {
        return std::nullopt;
    }
    fields.push_back(std::move(field));
    return fields;
}

CsvHeader::CsvHeader(const std::vector<std::string>& names) : width_(names.size()) {
    for (std::size_t i = 0; i < names.size(); ++i) {
        std::string name = names[i];
        // Strip a UTF-8 byte order mark from the first column
        if (i == 0 && name.size() >= 3 && name.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            name.erase(0, 3);
        }
        index_.emplace(name, i);
    }
}

std::size_t CsvHeader::require(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        throw DataAnomaly("result is missing column '" + name + "'", 1);
    }
    return it->second;
}

}
