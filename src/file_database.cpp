/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "bootq/file_database.hpp"
#include "bootq/logger.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace bootq {

namespace {

const char kJournalMagic[] = "BQJ1";
constexpr std::size_t kJournalMagicSize = 4;

bool readFile(const std::filesystem::path& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return false;
    out.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return !file.bad();
}

bool writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) return false;

    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.flush();
    file.close();

    return file.good();
}

void appendUint32(std::string& out, std::uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        out.push_back(static_cast<char>((value >> shift) & 0xff));
    }
}

bool readUint32(const std::string& raw, std::size_t& pos, std::uint32_t& value) {
    if (raw.size() - pos < 4) return false;
    value = 0;
    for (int i = 0; i < 4; ++i) {
        value = (value << 8) | static_cast<unsigned char>(raw[pos++]);
    }
    return true;
}

bool readBlob(const std::string& raw, std::size_t& pos, std::string& out) {
    std::uint32_t size = 0;
    if (!readUint32(raw, pos, size)) return false;
    if (raw.size() - pos < size) return false;
    out = raw.substr(pos, size);
    pos += size;
    return true;
}

// Values are loaded lazily; keys are listed and sorted up front.
class FileIterator final : public Iterator {
public:
    FileIterator(const FileDatabase& db, std::vector<std::string> keys)
        : db_(db), keys_(std::move(keys)) {}

    bool next() override {
        if (!error_.ok || released_) {
            return false;
        }
        if (!started_) {
            started_ = true;
        } else if (position_ < keys_.size()) {
            ++position_;
        }
        loaded_ = false;
        return position_ < keys_.size();
    }

    [[nodiscard]] const std::string& key() const override {
        if (!started_ || position_ >= keys_.size()) return empty_;
        return keys_[position_];
    }

    [[nodiscard]] const std::string& value() const override {
        if (!started_ || position_ >= keys_.size()) return empty_;
        if (!loaded_) {
            value_.clear();
            if (!readFile(db_.keyPath(keys_[position_]), value_)) {
                LOG_ERROR("Failed to read value during iteration: " + keyToFileName(keys_[position_]));
                error_ = Result::failure(ErrorCode::IoError, "Failed to read " + keyToFileName(keys_[position_]));
            }
            loaded_ = true;
        }
        return value_;
    }

    [[nodiscard]] Result error() const override { return error_; }

    void release() noexcept override {
        keys_.clear();
        value_.clear();
        released_ = true;
    }

private:
    const FileDatabase& db_;
    std::vector<std::string> keys_;
    std::size_t position_ = 0;
    bool started_ = false;
    bool released_ = false;
    mutable bool loaded_ = false;
    mutable std::string value_;
    mutable Result error_;
    std::string empty_;
};

}

std::string keyToFileName(const std::string& key) {
    static const char digits[] = "0123456789abcdef";
    std::string name = "k";
    name.reserve(1 + key.size() * 2);
    for (unsigned char c : key) {
        name.push_back(digits[c >> 4]);
        name.push_back(digits[c & 0x0f]);
    }
    return name;
}

bool fileNameToKey(const std::string& name, std::string& key) noexcept {
    if (name.empty() || name[0] != 'k' || name.size() % 2 != 1) {
        return false;
    }
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return -1;
    };
    try {
        std::string decoded;
        decoded.reserve(name.size() / 2);
        for (std::size_t i = 1; i < name.size(); i += 2) {
            int hi = nibble(name[i]);
            int lo = nibble(name[i + 1]);
            if (hi < 0 || lo < 0) return false;
            decoded.push_back(static_cast<char>((hi << 4) | lo));
        }
        key.swap(decoded);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::string keyShard(const std::string& key) {
    if (key.empty()) {
        return "";
    }
    return keyToFileName(key.substr(0, 1)).substr(1);
}

FileDatabase::FileDatabase(const std::filesystem::path& workspace, OpenMode mode)
    : workspace_(workspace),
      dataPath_(workspace / "data"),
      writingPath_(workspace / "writing"),
      journalPath_(workspace / "journal"),
      mode_(mode) {
    if (!createWorkspace()) {
        LOG_ERROR("Failed to initialize workspace: " + workspace_.string());
        throw std::runtime_error("Failed to initialize workspace: " + workspace_.string());
    }

    if (mode_ == OpenMode::ReadOnly) {
        std::error_code ec;
        journalPending_ = std::filesystem::exists(journalPath_ / "batch.log", ec);
        if (journalPending_) {
            LOG_WARN("Committed batch not replayed, contents may be partly applied: " + workspace_.string());
        }
    } else if (!recoverJournal()) {
        throw std::runtime_error("Failed to replay journal in workspace: " + workspace_.string());
    }
    LOG_DEBUG("FileDatabase opened: " + workspace_.string());
}

bool FileDatabase::isWorkspace(const std::filesystem::path& dir) noexcept {
    std::error_code ec;
    return std::filesystem::is_directory(dir / "data", ec) &&
           std::filesystem::is_directory(dir / "journal", ec);
}

bool FileDatabase::createWorkspace() noexcept {
    try {
        if (mode_ != OpenMode::Create) {
            return isWorkspace(workspace_);
        }

        std::filesystem::create_directories(dataPath_);
        std::filesystem::create_directories(writingPath_);
        std::filesystem::create_directories(journalPath_);

        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create workspace: " + std::string(e.what()));
        return false;
    }
}

bool FileDatabase::recoverJournal() noexcept {
    try {
        // An uncommitted batch never happened
        std::error_code ec;
        if (std::filesystem::remove(journalPath_ / "batch.tmp", ec)) {
            LOG_WARN("Discarded uncommitted batch in " + journalPath_.string());
        }

        // Staged single writes that never got published
        std::filesystem::create_directories(writingPath_);
        for (const auto& entry : std::filesystem::directory_iterator(writingPath_)) {
            std::filesystem::remove(entry.path(), ec);
        }

        auto logPath = journalPath_ / "batch.log";
        if (!std::filesystem::exists(logPath)) {
            return true;
        }

        LOG_WARN("Replaying committed batch: " + logPath.string());
        std::string raw;
        if (!readFile(logPath, raw)) {
            LOG_ERROR("Failed to read journal: " + logPath.string());
            return false;
        }

        std::vector<WriteBatch::Op> ops;
        if (!decodeJournal(raw, ops)) {
            LOG_ERROR("Corrupt journal: " + logPath.string());
            return false;
        }

        Result applied = apply(ops);
        if (!applied) {
            LOG_ERROR("Failed to replay journal: " + applied.message);
            return false;
        }

        std::filesystem::remove(logPath);
        LOG_INFO("Replayed " + std::to_string(ops.size()) + " journaled op(s)");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Error recovering journal: " + std::string(e.what()));
        return false;
    }
}

std::filesystem::path FileDatabase::keyPath(const std::string& key) const {
    return dataPath_ / keyShard(key) / keyToFileName(key);
}

Result FileDatabase::checkWritable() const noexcept {
    if (mode_ == OpenMode::ReadOnly) {
        return Result::failure(ErrorCode::IoError, "workspace opened read-only");
    }
    if (journalPending_) {
        return Result::failure(ErrorCode::IoError, "committed batch awaiting replay, reopen the workspace");
    }
    return Result::success();
}

HasResult FileDatabase::has(const std::string& key) const noexcept {
    try {
        std::error_code ec;
        bool found = std::filesystem::exists(keyPath(key), ec);
        if (ec) {
            return {false, false, ErrorCode::IoError, ec.message()};
        }
        return {true, found, ErrorCode::None, ""};
    } catch (const std::exception& e) {
        return {false, false, ErrorCode::IoError, e.what()};
    }
}

ReadResult FileDatabase::get(const std::string& key) const noexcept {
    try {
        auto path = keyPath(key);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            if (ec) {
                return {false, "", ErrorCode::IoError, ec.message()};
            }
            return {false, "", ErrorCode::NotFound, "not found"};
        }

        std::string value;
        if (!readFile(path, value)) {
            LOG_ERROR("Failed to read " + path.string());
            return {false, "", ErrorCode::IoError, "Failed to read " + path.filename().string()};
        }
        return {true, std::move(value), ErrorCode::None, ""};
    } catch (const std::exception& e) {
        return {false, "", ErrorCode::IoError, e.what()};
    }
}

bool FileDatabase::writeFileAtomic(const std::string& key, const std::string& value) const noexcept {
    try {
        auto name = keyToFileName(key);
        auto stagedPath = writingPath_ / name;
        if (!writeFile(stagedPath, value)) {
            std::error_code ec;
            std::filesystem::remove(stagedPath, ec);
            return false;
        }

        auto finalPath = keyPath(key);
        std::filesystem::create_directories(finalPath.parent_path());
        std::filesystem::rename(stagedPath, finalPath);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to publish key file: " + std::string(e.what()));
        return false;
    }
}

Result FileDatabase::putFile(const std::string& key, const std::string& value) noexcept {
    if (!writeFileAtomic(key, value)) {
        return Result::failure(ErrorCode::IoError, "Failed to write " + keyToFileName(key));
    }
    return Result::success();
}

Result FileDatabase::removeFile(const std::string& key) noexcept {
    try {
        std::error_code ec;
        std::filesystem::remove(keyPath(key), ec);
        if (ec) {
            LOG_ERROR("Failed to delete " + keyToFileName(key) + ": " + ec.message());
            return Result::failure(ErrorCode::IoError, ec.message());
        }
        return Result::success();
    } catch (const std::exception& e) {
        return Result::failure(ErrorCode::IoError, e.what());
    }
}

Result FileDatabase::put(const std::string& key, const std::string& value) noexcept {
    Result writable = checkWritable();
    if (!writable) {
        return writable;
    }
    return putFile(key, value);
}

Result FileDatabase::del(const std::string& key) noexcept {
    Result writable = checkWritable();
    if (!writable) {
        return writable;
    }
    return removeFile(key);
}

IteratorPtr FileDatabase::newIterator(const std::string& prefix) const {
    std::vector<std::string> keys;

    try {
        // Names preserve key order and prefixes, so filtering and sorting
        // happen on names and only matches are decoded.
        std::string namePrefix = keyToFileName(prefix);
        std::vector<std::filesystem::path> shards;
        if (prefix.empty()) {
            std::error_code ec;
            if (std::filesystem::is_regular_file(dataPath_ / namePrefix, ec)) {
                keys.emplace_back();
            }
            for (const auto& entry : std::filesystem::directory_iterator(dataPath_)) {
                if (entry.is_directory()) {
                    shards.push_back(entry.path());
                }
            }
            std::sort(shards.begin(), shards.end());
        } else {
            auto shard = dataPath_ / keyShard(prefix);
            std::error_code ec;
            if (std::filesystem::is_directory(shard, ec)) {
                shards.push_back(shard);
            }
        }

        for (const auto& shard : shards) {
            std::vector<std::string> names;
            for (const auto& entry : std::filesystem::directory_iterator(shard)) {
                if (!entry.is_regular_file()) {
                    continue;
                }
                std::string name = entry.path().filename().string();
                if (name.compare(0, namePrefix.size(), namePrefix) == 0) {
                    names.push_back(std::move(name));
                }
            }

            // Directory order is unspecified; the store is ordered by key bytes
            std::sort(names.begin(), names.end());
            for (const auto& name : names) {
                std::string key;
                if (!fileNameToKey(name, key)) {
                    LOG_TRACE("Skipping foreign file: " + (shard / name).string());
                    continue;
                }
                keys.push_back(std::move(key));
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to list " + dataPath_.string() + ": " + e.what());
        return std::make_unique<SnapshotIterator>(
            std::vector<SnapshotIterator::Entry>{}, Result::failure(ErrorCode::IoError, e.what()));
    }

    return std::make_unique<FileIterator>(*this, std::move(keys));
}

Result FileDatabase::write(const WriteBatch& batch) noexcept {
    Result writable = checkWritable();
    if (!writable) {
        return writable;
    }
    if (batch.empty()) {
        return Result::success();
    }

    try {
        auto tmpPath = journalPath_ / "batch.tmp";
        auto logPath = journalPath_ / "batch.log";

        // Never overwrite a committed batch that has not been applied
        if (std::filesystem::exists(logPath)) {
            journalPending_ = true;
            LOG_ERROR("Committed batch awaiting replay: " + logPath.string());
            return Result::failure(ErrorCode::IoError, "committed batch awaiting replay, reopen the workspace");
        }

        if (!writeFile(tmpPath, encodeJournal(batch))) {
            std::error_code ec;
            std::filesystem::remove(tmpPath, ec);
            LOG_ERROR("Failed to write journal: " + tmpPath.string());
            return Result::failure(ErrorCode::IoError, "Failed to write journal");
        }

        // Commit point
        std::filesystem::rename(tmpPath, logPath);

        Result applied = apply(batch.ops());
        if (!applied) {
            // The log stays behind for the next open; until then nothing
            // else may be written over a partly applied batch.
            journalPending_ = true;
            LOG_ERROR("Committed batch not fully applied: " + applied.message);
            return applied;
        }

        std::filesystem::remove(logPath);
        LOG_TRACE("Batch applied: " + std::to_string(batch.size()) + " op(s)");
        return Result::success();
    } catch (const std::exception& e) {
        LOG_ERROR("Batch write failed: " + std::string(e.what()));
        return Result::failure(ErrorCode::IoError, e.what());
    }
}

Result FileDatabase::apply(const std::vector<WriteBatch::Op>& ops) noexcept {
    for (const auto& op : ops) {
        Result r = op.type == WriteBatch::OpType::Put ? putFile(op.key, op.value) : removeFile(op.key);
        if (!r) {
            return r;
        }
    }
    return Result::success();
}

std::string FileDatabase::encodeJournal(const WriteBatch& batch) {
    std::string out(kJournalMagic, kJournalMagicSize);
    appendUint32(out, static_cast<std::uint32_t>(batch.size()));
    for (const auto& op : batch.ops()) {
        out.push_back(static_cast<char>(op.type));
        appendUint32(out, static_cast<std::uint32_t>(op.key.size()));
        out += op.key;
        appendUint32(out, static_cast<std::uint32_t>(op.value.size()));
        out += op.value;
    }
    return out;
}

bool FileDatabase::decodeJournal(const std::string& raw, std::vector<WriteBatch::Op>& ops) {
    if (raw.size() < kJournalMagicSize || raw.compare(0, kJournalMagicSize, kJournalMagic) != 0) {
        return false;
    }
    std::size_t pos = kJournalMagicSize;
    std::uint32_t count = 0;
    if (!readUint32(raw, pos, count)) {
        return false;
    }

    std::vector<WriteBatch::Op> decoded;
    for (std::uint32_t i = 0; i < count; ++i) {
        if (pos >= raw.size()) return false;
        auto type = static_cast<WriteBatch::OpType>(static_cast<unsigned char>(raw[pos++]));
        if (type != WriteBatch::OpType::Put && type != WriteBatch::OpType::Delete) {
            return false;
        }
        WriteBatch::Op op{type, "", ""};
        if (!readBlob(raw, pos, op.key) || !readBlob(raw, pos, op.value)) {
            return false;
        }
        decoded.push_back(std::move(op));
    }
    if (pos != raw.size()) {
        return false;
    }
    ops.swap(decoded);
    return true;
}

}
