/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <map>
#include <string>

#include "bootq/database.hpp"

namespace bootq {

// In-process ordered store. Nothing survives the object.
class MemoryDatabase final : public Database {
public:
    MemoryDatabase() = default;

    MemoryDatabase(const MemoryDatabase&) = delete;
    MemoryDatabase& operator=(const MemoryDatabase&) = delete;

    [[nodiscard]] HasResult has(const std::string& key) const noexcept override;
    [[nodiscard]] ReadResult get(const std::string& key) const noexcept override;
    [[nodiscard]] Result put(const std::string& key, const std::string& value) noexcept override;
    [[nodiscard]] Result del(const std::string& key) noexcept override;
    [[nodiscard]] IteratorPtr newIterator(const std::string& prefix = "") const override;
    [[nodiscard]] Result write(const WriteBatch& batch) noexcept override;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

private:
    std::map<std::string, std::string> entries_;
};

}
