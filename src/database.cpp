/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "bootq/database.hpp"
#include "bootq/logger.hpp"

namespace bootq {

void WriteBatch::put(std::string key, std::string value) {
    ops_.push_back({OpType::Put, std::move(key), std::move(value)});
}

void WriteBatch::del(std::string key) {
    ops_.push_back({OpType::Delete, std::move(key), std::string()});
}

void Database::batchPut(WriteBatch& batch, const std::string& key, const std::string& value) const {
    batch.put(key, value);
}

void Database::batchDelete(WriteBatch& batch, const std::string& key) const {
    batch.del(key);
}

SnapshotIterator::SnapshotIterator(std::vector<Entry> entries, Result error)
    : entries_(std::move(entries)), error_(std::move(error)) {
}

bool SnapshotIterator::next() {
    if (!error_.ok) {
        return false;
    }
    if (!started_) {
        started_ = true;
        position_ = 0;
    } else if (position_ < entries_.size()) {
        ++position_;
    }
    return position_ < entries_.size();
}

const std::string& SnapshotIterator::key() const {
    if (!started_ || position_ >= entries_.size()) {
        return empty_;
    }
    return entries_[position_].first;
}

const std::string& SnapshotIterator::value() const {
    if (!started_ || position_ >= entries_.size()) {
        return empty_;
    }
    return entries_[position_].second;
}

void SnapshotIterator::release() noexcept {
    entries_.clear();
    entries_.shrink_to_fit();
    started_ = true;
    position_ = 0;
}

std::string encodeUint64(std::uint64_t value) {
    std::string out(8, '\0');
    for (int i = 7; i >= 0; --i) {
        out[static_cast<std::size_t>(i)] = static_cast<char>(value & 0xff);
        value >>= 8;
    }
    return out;
}

bool decodeUint64(const std::string& raw, std::uint64_t& out) noexcept {
    if (raw.size() != 8) {
        return false;
    }
    std::uint64_t value = 0;
    for (unsigned char c : raw) {
        value = (value << 8) | c;
    }
    out = value;
    return true;
}

CountResult getUint64(const Database& db, const std::string& key) noexcept {
    ReadResult read = db.get(key);
    if (!read) {
        return {false, 0, read.error, read.message};
    }
    std::uint64_t value = 0;
    if (!decodeUint64(read.value, value)) {
        return {false, 0, ErrorCode::ConversionError,
                "Expected 8 byte integer, found " + std::to_string(read.value.size()) + " bytes"};
    }
    return {true, value, ErrorCode::None, ""};
}

CountResult countEntries(const Database& db, const std::string& prefix) noexcept {
    try {
        IteratorPtr it = db.newIterator(prefix);
        std::uint64_t count = 0;
        while (it->next()) {
            ++count;
        }
        Result err = it->error();
        if (!err) {
            return {false, 0, err.error, err.message};
        }
        return {true, count, ErrorCode::None, ""};
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to count entries: " + std::string(e.what()));
        return {false, 0, ErrorCode::IoError, e.what()};
    }
}

}
