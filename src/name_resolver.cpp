/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "thaw/name_resolver.hpp"
#include "thaw/status_store.hpp"
#include "thaw/logger.hpp"
#include <cctype>
#include <optional>

namespace thaw {

namespace {
std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::optional<std::string> decodeBase64(const std::string& input) {
    auto value = [](unsigned char c) -> int {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+' || c == '-') return 62;
        if (c == '/' || c == '_') return 63;
        return -1;
    };

    std::string out;
    unsigned int buffer = 0;
    int bits = 0;
    for (unsigned char c : input) {
        if (c == '=') break;
        if (std::isspace(c)) continue;
        int v = value(c);
        if (v < 0) {
            return std::nullopt;
        }
        buffer = (buffer << 6) | static_cast<unsigned int>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out += static_cast<char>((buffer >> bits) & 0xff);
        }
    }
    return out;
}

std::optional<std::string> between(const std::string& text, const std::string& open, const std::string& close) {
    auto start = text.find(open);
    if (start == std::string::npos) {
        return std::nullopt;
    }
    start += open.size();
    auto end = text.find(close, start);
    if (end == std::string::npos) {
        return std::nullopt;
    }
    return text.substr(start, end - start);
}

// "Path" : "value" with \" and \\ escapes
std::optional<std::string> jsonPath(const std::string& text) {
    auto key = text.find("\"Path\"");
    if (key == std::string::npos) {
        return std::nullopt;
    }
    auto colon = text.find(':', key + 6);
    if (colon == std::string::npos) {
        return std::nullopt;
    }
    auto quote = text.find('"', colon + 1);
    if (quote == std::string::npos) {
        return std::nullopt;
    }
    std::string out;
    for (std::size_t i = quote + 1; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\\' && i + 1 < text.size()) {
            out += text[++i];
        } else if (c == '"') {
            return out;
        } else {
            out += c;
        }
    }
    return std::nullopt;
}

std::string stripLeadingSlash(std::string path) {
    while (!path.empty() && path.front() == '/') {
        path.erase(0, 1);
    }
    return path;
}
}

std::string parseFileName(const ArchiveId& archiveId, const std::string& description) {
    std::string descr = trim(description);
    if (descr.empty()) {
        return "00_undefined/" + archiveId;
    }

    if (descr.rfind("<m>", 0) == 0) {
        if (auto encoded = between(descr, "<p>", "</p>")) {
            if (auto decoded = decodeBase64(*encoded)) {
                std::string path = stripLeadingSlash(trim(*decoded));
                if (!path.empty()) {
                    return path;
                }
            }
        }
        LOG_DEBUG("Unrecognized archive metadata for " + archiveId + ", using description as is");
    } else if (descr.front() == '{') {
        if (auto path = jsonPath(descr)) {
            std::string cleaned = stripLeadingSlash(trim(*path));
            if (!cleaned.empty()) {
                return cleaned;
            }
        }
    }

    return descr;
}

std::string NameResolver::resolve(const ArchiveId& archiveId, const std::string& description,
                                  const std::string& creationTimestamp) {
    std::string name = parseFileName(archiveId, description);

    // The in-memory set covers names the secondary index may not show yet
    if (seen_.count(name) > 0 || store_.nameExists(name)) {
        LOG_DEBUG("Duplicate name " + name + ", suffixing creation date");
        name += "-" + creationTimestamp;
        ++renamed_;
    }

    seen_.insert(name);
    return name;
}

}
