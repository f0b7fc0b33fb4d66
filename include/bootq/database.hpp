/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "bootq/types.hpp"

namespace bootq {

// Ordered sequence of puts and deletes committed together by Database::write.
class WriteBatch {
public:
    enum class OpType : std::uint8_t { Put = 1, Delete = 2 };

    struct Op {
        OpType type;
        std::string key;
        std::string value;
    };

    void put(std::string key, std::string value);
    void del(std::string key);
    void clear() noexcept { ops_.clear(); }

    [[nodiscard]] bool empty() const noexcept { return ops_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return ops_.size(); }
    [[nodiscard]] const std::vector<Op>& ops() const noexcept { return ops_; }

private:
    std::vector<Op> ops_;
};

// Forward iterator over a key range. Holds store resources until released;
// the destructor releases, so owning it through std::unique_ptr covers every
// exit path.
class Iterator {
public:
    virtual ~Iterator() = default;

    // Advances to the next entry; false when exhausted or on error.
    virtual bool next() = 0;
    [[nodiscard]] virtual const std::string& key() const = 0;
    [[nodiscard]] virtual const std::string& value() const = 0;
    // Error that stopped iteration, if any.
    [[nodiscard]] virtual Result error() const = 0;
    virtual void release() noexcept = 0;
};

using IteratorPtr = std::unique_ptr<Iterator>;

// Ordered key-value store.
class Database {
public:
    virtual ~Database() = default;

    [[nodiscard]] virtual HasResult has(const std::string& key) const noexcept = 0;
    // NotFound when the key is absent.
    [[nodiscard]] virtual ReadResult get(const std::string& key) const noexcept = 0;
    [[nodiscard]] virtual Result put(const std::string& key, const std::string& value) noexcept = 0;
    // Deleting an absent key succeeds.
    [[nodiscard]] virtual Result del(const std::string& key) noexcept = 0;

    // Iterates keys starting with `prefix` in ascending byte order. Keys are
    // reported relative to this database.
    [[nodiscard]] virtual IteratorPtr newIterator(const std::string& prefix = "") const = 0;

    // Applies every op of `batch` or none of them.
    [[nodiscard]] virtual Result write(const WriteBatch& batch) noexcept = 0;

    // Record an op in a batch whose keys are resolved to the underlying
    // store, so ops staged through different views can be committed together
    // with commit(). Views override these to translate their keys.
    virtual void batchPut(WriteBatch& batch, const std::string& key, const std::string& value) const;
    virtual void batchDelete(WriteBatch& batch, const std::string& key) const;
    [[nodiscard]] virtual Result commit(const WriteBatch& batch) noexcept { return write(batch); }
};

// Iterator over an already materialized, sorted set of entries.
class SnapshotIterator final : public Iterator {
public:
    using Entry = std::pair<std::string, std::string>;

    explicit SnapshotIterator(std::vector<Entry> entries, Result error = Result::success());

    bool next() override;
    [[nodiscard]] const std::string& key() const override;
    [[nodiscard]] const std::string& value() const override;
    [[nodiscard]] Result error() const override { return error_; }
    void release() noexcept override;

private:
    std::vector<Entry> entries_;
    std::size_t position_ = 0;
    bool started_ = false;
    Result error_;
    std::string empty_;
};

// Big-endian fixed width encoding used for counters and sequence keys.
[[nodiscard]] std::string encodeUint64(std::uint64_t value);
[[nodiscard]] bool decodeUint64(const std::string& raw, std::uint64_t& out) noexcept;

[[nodiscard]] CountResult getUint64(const Database& db, const std::string& key) noexcept;

// Counts every key under `prefix`.
[[nodiscard]] CountResult countEntries(const Database& db, const std::string& prefix = "") noexcept;

}
