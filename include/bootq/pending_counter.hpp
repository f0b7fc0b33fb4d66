/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>

#include "bootq/database.hpp"

namespace bootq {

// Persisted count of jobs resident in the job store and not yet executed.
// Updates are staged into the batch of the mutation that causes them and
// applied in memory only after that batch commits.
class PendingCounter {
public:
    explicit PendingCounter(Database& db) noexcept;

    PendingCounter(const PendingCounter&) = delete;
    PendingCounter& operator=(const PendingCounter&) = delete;

    // Reads the checkpoint; when there is none, counts `jobs` once and
    // persists that count.
    [[nodiscard]] Result initialize(const Database& jobs) noexcept;

    // Checkpoint only. NotFound when it was never written.
    [[nodiscard]] CountResult load() const noexcept;

    [[nodiscard]] std::uint64_t value() const noexcept { return count_; }

    // Return the value to pass to apply() once the batch is committed.
    [[nodiscard]] std::uint64_t stageIncrement(WriteBatch& batch) const;
    // Clamped at zero; stages nothing when already zero.
    [[nodiscard]] std::uint64_t stageDecrement(WriteBatch& batch) const;

    void apply(std::uint64_t value) noexcept { count_ = value; }

private:
    Database& db_;
    std::uint64_t count_ = 0;
};

}
