/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "bootq/memory_database.hpp"
#include <set>

namespace bootq {

HasResult MemoryDatabase::has(const std::string& key) const noexcept {
    return {true, entries_.find(key) != entries_.end(), ErrorCode::None, ""};
}

ReadResult MemoryDatabase::get(const std::string& key) const noexcept {
    try {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return {false, "", ErrorCode::NotFound, "not found"};
        }
        return {true, it->second, ErrorCode::None, ""};
    } catch (const std::exception& e) {
        return {false, "", ErrorCode::IoError, e.what()};
    }
}

Result MemoryDatabase::put(const std::string& key, const std::string& value) noexcept {
    try {
        entries_[key] = value;
        return Result::success();
    } catch (const std::exception& e) {
        return Result::failure(ErrorCode::IoError, e.what());
    }
}

Result MemoryDatabase::del(const std::string& key) noexcept {
    entries_.erase(key);
    return Result::success();
}

IteratorPtr MemoryDatabase::newIterator(const std::string& prefix) const {
    std::vector<SnapshotIterator::Entry> snapshot;
    for (auto it = entries_.lower_bound(prefix); it != entries_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        snapshot.emplace_back(it->first, it->second);
    }
    return std::make_unique<SnapshotIterator>(std::move(snapshot));
}

Result MemoryDatabase::write(const WriteBatch& batch) noexcept {
    std::map<std::string, std::string> puts;
    std::set<std::string> deletes;
    try {
        // Everything that allocates happens here, before entries_ is touched
        for (const auto& op : batch.ops()) {
            if (op.type == WriteBatch::OpType::Put) {
                deletes.erase(op.key);
                puts[op.key] = op.value;
            } else {
                puts.erase(op.key);
                deletes.insert(op.key);
            }
        }
    } catch (const std::exception& e) {
        return Result::failure(ErrorCode::IoError, e.what());
    }

    for (const auto& key : deletes) {
        entries_.erase(key);
    }
    while (!puts.empty()) {
        auto node = puts.extract(puts.begin());
        auto it = entries_.find(node.key());
        if (it != entries_.end()) {
            it->second.swap(node.mapped());
        } else {
            entries_.insert(std::move(node));
        }
    }
    return Result::success();
}

}
