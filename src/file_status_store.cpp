/*
 * thaw - Archive Retrieval Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "thaw/status_store.hpp"
#include "thaw/errors.hpp"
#include "thaw/logger.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <unistd.h>

namespace thaw {

namespace {
constexpr std::size_t kMaxComponent = 200;

bool isSafeKey(const std::string& key) {
    if (key.empty() || key.size() > kMaxComponent || key[0] == '.') {
        return false;
    }
    return std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_' || c == '.';
    });
}

std::string toHex(const std::string& value) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(value.size() * 2);
    for (unsigned char c : value) {
        out += digits[c >> 4];
        out += digits[c & 0x0f];
    }
    return out;
}

std::string rowKey(RowSeq rowSeq) {
    std::ostringstream oss;
    oss << std::setw(20) << std::setfill('0') << rowSeq;
    return oss.str();
}

std::string escape(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::string unescape(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '\\' && i + 1 < value.size()) {
            char n = value[++i];
            if (n == 'n') out += '\n';
            else if (n == 'r') out += '\r';
            else out += n;
        } else {
            out += value[i];
        }
    }
    return out;
}

template <typename T>
T parseNumber(const std::string& key, const std::string& value) {
    try {
        std::size_t pos = 0;
        long long parsed = std::stoll(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument(value);
        }
        return static_cast<T>(parsed);
    } catch (const std::exception&) {
        throw ExternalFailure("corrupt status record: bad " + key + " '" + value + "'");
    }
}

std::uint64_t parseUnsigned(const std::string& key, const std::string& value) {
    try {
        std::size_t pos = 0;
        unsigned long long parsed = std::stoull(value, &pos);
        if (pos != value.size() || value.empty() || value[0] == '-') {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw ExternalFailure("corrupt status record: bad " + key + " '" + value + "'");
    }
}

std::string uniqueTempName() {
    static std::atomic<uint64_t> counter{0};
    std::ostringstream oss;
    oss << getpid() << "_" << counter.fetch_add(1) << ".tmp";
    return oss.str();
}

void writeWhole(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw ExternalFailure("cannot open " + path.string() + " for writing");
    }
    file << content;
    file.flush();
    if (!file.good()) {
        throw ExternalFailure("failed writing " + path.string());
    }
}
}

std::string serializeRecord(const RetrievalStatusRecord& record) {
    std::ostringstream out;
    out << "aid=" << escape(record.archiveId) << "\n";
    out << "jobId=" << escape(record.jobHandle) << "\n";
    out << "pid=" << record.partitionId << "\n";
    out << "ifn=" << record.rowSeq << "\n";
    out << "sha=" << escape(record.contentHash) << "\n";
    out << "sz=" << record.sizeBytes << "\n";
    out << "cdt=" << escape(record.requestTimestamp) << "\n";
    out << "descr=" << escape(record.description) << "\n";
    out << "fname=" << escape(record.resolvedName) << "\n";
    out << "cc=" << record.chunkCount << "\n";
    out << "rc=" << record.retryCount << "\n";
    return out.str();
}

RetrievalStatusRecord parseRecord(const std::string& text) {
    RetrievalStatusRecord record;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);

        if (key == "aid") record.archiveId = unescape(value);
        else if (key == "jobId") record.jobHandle = unescape(value);
        else if (key == "pid") record.partitionId = parseNumber<PartitionId>(key, value);
        else if (key == "ifn") record.rowSeq = parseNumber<RowSeq>(key, value);
        else if (key == "sha") record.contentHash = unescape(value);
        else if (key == "sz") record.sizeBytes = parseUnsigned(key, value);
        else if (key == "cdt") record.requestTimestamp = unescape(value);
        else if (key == "descr") record.description = unescape(value);
        else if (key == "fname") record.resolvedName = unescape(value);
        else if (key == "cc") record.chunkCount = parseUnsigned(key, value);
        else if (key == "rc") record.retryCount = static_cast<std::uint32_t>(parseUnsigned(key, value));
    }
    if (record.archiveId.empty()) {
        throw ExternalFailure("corrupt status record: no archive id");
    }
    return record;
}

FileStatusStore::FileStatusStore(const std::filesystem::path& root, bool createIfMissing) : root_(root) {
    std::error_code ec;
    for (const char* dir : {"records", "by-partition", "by-name", "tmp"}) {
        if (!createIfMissing) {
            if (!std::filesystem::is_directory(root_ / dir, ec)) {
                throw ExternalFailure("no status store at " + root_.string());
            }
            continue;
        }
        std::filesystem::create_directories(root_ / dir, ec);
        if (ec) {
            throw ExternalFailure("cannot create status store at " + root_.string() + ": " + ec.message());
        }
    }
    LOG_DEBUG("Status store opened at " + root_.string());
}

bool FileStatusStore::insert(const RetrievalStatusRecord& record) {
    if (record.archiveId.empty()) {
        throw std::invalid_argument("status record without archive id");
    }

    auto target = recordPath(record.archiveId);
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        throw ExternalFailure("cannot create record directory for " + record.archiveId + ": " + ec.message());
    }
    auto temp = root_ / "tmp" / uniqueTempName();
    writeWhole(temp, serializeRecord(record));

    // link() refuses to replace an existing name, which makes the primary
    // key insert-if-absent across processes.
    int rc = ::link(temp.c_str(), target.c_str());
    int err = errno;
    std::filesystem::remove(temp, ec);
    if (rc != 0) {
        if (err == EEXIST) {
            LOG_DEBUG("Status record already present for " + record.archiveId);
            return false;
        }
        throw ExternalFailure("cannot store status record for " + record.archiveId + ": " + std::strerror(err));
    }

    reindex(record);
    return true;
}

void FileStatusStore::reindex(const RetrievalStatusRecord& record) {
    std::error_code ec;
    auto partitionPath = partitionDir(record.partitionId);
    std::filesystem::create_directories(partitionPath, ec);
    if (ec) {
        throw ExternalFailure("cannot index partition " + std::to_string(record.partitionId) + ": " + ec.message());
    }
    writeIndexEntry(partitionPath / rowKey(record.rowSeq), record.archiveId);

    if (!record.resolvedName.empty()) {
        auto name = namePath(record.resolvedName);
        std::filesystem::create_directories(name.parent_path(), ec);
        if (ec) {
            throw ExternalFailure("cannot index name " + record.resolvedName + ": " + ec.message());
        }
        writeIndexEntry(name, record.archiveId);
    }
}

RowSeq FileStatusStore::maxRowSeq(PartitionId partition) const {
    auto rows = readPartitionIndex(partition);
    auto max = std::max_element(rows.begin(), rows.end());
    return max == rows.end() ? 0 : *max;
}

bool FileStatusStore::nameExists(const std::string& resolvedName) const {
    std::error_code ec;
    return std::filesystem::exists(namePath(resolvedName), ec);
}

std::optional<RetrievalStatusRecord> FileStatusStore::get(const ArchiveId& archiveId) const {
    std::ifstream file(recordPath(archiveId), std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return parseRecord(text);
}

std::vector<RowSeq> FileStatusStore::listPartition(PartitionId partition) const {
    auto rows = readPartitionIndex(partition);
    std::sort(rows.begin(), rows.end());
    return rows;
}

std::vector<RowSeq> FileStatusStore::readPartitionIndex(PartitionId partition) const {
    std::vector<RowSeq> rows;
    auto dir = partitionDir(partition);
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) {
        return rows;
    }

    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        throw ExternalFailure("cannot read partition index " + dir.string() + ": " + ec.message());
    }
    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        if (name.empty() || !std::all_of(name.begin(), name.end(), [](unsigned char c) { return std::isdigit(c); })) {
            continue;
        }
        try {
            rows.push_back(static_cast<RowSeq>(std::stoll(name)));
        } catch (const std::out_of_range&) {
            LOG_WARN("Ignoring out-of-range index entry " + entry.path().string());
        }
    }
    return rows;
}

std::filesystem::path FileStatusStore::recordPath(const ArchiveId& archiveId) const {
    if (isSafeKey(archiveId)) {
        return root_ / "records" / archiveId;
    }
    // Hex keys carry a prefix no plain key can start with
    std::string hex = toHex(archiveId);
    std::filesystem::path path = root_ / "records";
    for (std::size_t pos = 0; pos < hex.size(); pos += kMaxComponent) {
        std::string part = hex.substr(pos, kMaxComponent);
        path /= (pos == 0 ? "%" + part : part);
    }
    return path;
}

std::filesystem::path FileStatusStore::partitionDir(PartitionId partition) const {
    return root_ / "by-partition" / std::to_string(partition);
}

std::filesystem::path FileStatusStore::namePath(const std::string& resolvedName) const {
    std::string hex = toHex(resolvedName);
    std::filesystem::path path = root_ / "by-name";
    for (std::size_t pos = 0; pos < hex.size(); pos += kMaxComponent) {
        path /= hex.substr(pos, kMaxComponent);
    }
    return path / "@";
}

void FileStatusStore::writeIndexEntry(const std::filesystem::path& path, const std::string& content) const {
    auto temp = root_ / "tmp" / uniqueTempName();
    writeWhole(temp, content);
    std::error_code ec;
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        throw ExternalFailure("cannot write index entry " + path.string() + ": " + ec.message());
    }
}

}
