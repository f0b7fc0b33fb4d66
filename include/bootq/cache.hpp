/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <functional>
#include <list>
#include <string>
#include <unordered_map>
#include <utility>

namespace bootq {

// Fixed capacity least-recently-used cache. Not synchronized.
template <typename K, typename V, typename Hash = std::hash<K>>
class LruCache {
public:
    explicit LruCache(std::size_t capacity) noexcept : capacity_(capacity == 0 ? 1 : capacity) {}

    // Inserts or replaces `key` and marks it most recently used.
    void put(const K& key, V value) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = std::move(value);
            entries_.splice(entries_.begin(), entries_, it->second);
            return;
        }
        entries_.emplace_front(key, std::move(value));
        index_[key] = entries_.begin();
        if (entries_.size() > capacity_) {
            index_.erase(entries_.back().first);
            entries_.pop_back();
        }
    }

    // Copies the cached value into `out` and marks it most recently used.
    bool get(const K& key, V& out) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        entries_.splice(entries_.begin(), entries_, it->second);
        out = it->second->second;
        return true;
    }

    [[nodiscard]] bool contains(const K& key) const { return index_.find(key) != index_.end(); }

    void evict(const K& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return;
        }
        entries_.erase(it->second);
        index_.erase(it);
    }

    void flush() noexcept {
        entries_.clear();
        index_.clear();
    }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    using Entry = std::pair<K, V>;

    std::size_t capacity_;
    std::list<Entry> entries_;
    std::unordered_map<K, typename std::list<Entry>::iterator, Hash> index_;
};

struct CacheMetrics {
    std::string name;
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::size_t size = 0;
};

// LruCache that counts lookups under `<namespace>_<name>`.
template <typename K, typename V, typename Hash = std::hash<K>>
class MeteredCache {
public:
    MeteredCache(const std::string& metricsNamespace, const std::string& name, std::size_t capacity)
        : cache_(capacity), name_(metricsNamespace.empty() ? name : metricsNamespace + "_" + name) {}

    void put(const K& key, V value) { cache_.put(key, std::move(value)); }

    bool get(const K& key, V& out) {
        if (cache_.get(key, out)) {
            ++hits_;
            return true;
        }
        ++misses_;
        return false;
    }

    // Presence check; not counted and does not refresh recency.
    [[nodiscard]] bool contains(const K& key) const { return cache_.contains(key); }

    void evict(const K& key) { cache_.evict(key); }
    void flush() noexcept { cache_.flush(); }

    [[nodiscard]] std::size_t size() const noexcept { return cache_.size(); }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] CacheMetrics metrics() const {
        return {name_, hits_, misses_, cache_.size()};
    }

private:
    LruCache<K, V, Hash> cache_;
    std::string name_;
    std::uint64_t hits_ = 0;
    std::uint64_t misses_ = 0;
};

}
