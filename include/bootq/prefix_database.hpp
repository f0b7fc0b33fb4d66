/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

#include "bootq/database.hpp"

namespace bootq {

// View of `parent` restricted to keys starting with `prefix`. Views nest; the
// parent must outlive the view.
class PrefixDatabase final : public Database {
public:
    PrefixDatabase(std::string prefix, Database& parent) noexcept;

    PrefixDatabase(const PrefixDatabase&) = delete;
    PrefixDatabase& operator=(const PrefixDatabase&) = delete;

    [[nodiscard]] HasResult has(const std::string& key) const noexcept override;
    [[nodiscard]] ReadResult get(const std::string& key) const noexcept override;
    [[nodiscard]] Result put(const std::string& key, const std::string& value) noexcept override;
    [[nodiscard]] Result del(const std::string& key) noexcept override;
    [[nodiscard]] IteratorPtr newIterator(const std::string& prefix = "") const override;
    // Prefixes every key of `batch` and writes it through the parent.
    [[nodiscard]] Result write(const WriteBatch& batch) noexcept override;

    void batchPut(WriteBatch& batch, const std::string& key, const std::string& value) const override;
    void batchDelete(WriteBatch& batch, const std::string& key) const override;
    [[nodiscard]] Result commit(const WriteBatch& batch) noexcept override { return parent_.commit(batch); }

    [[nodiscard]] const std::string& prefix() const noexcept { return prefix_; }

private:
    std::string prefix_;
    Database& parent_;

    [[nodiscard]] std::string wrap(const std::string& key) const { return prefix_ + key; }
};

}
