/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <vector>

#include "bootq/database.hpp"

namespace bootq {

// Ids referenced as dependencies but not resident yet.
class MissingSet {
public:
    MissingSet(Database& root, Database& ids) noexcept;

    MissingSet(const MissingSet&) = delete;
    MissingSet& operator=(const MissingSet&) = delete;

    [[nodiscard]] Result add(const std::vector<JobId>& ids) noexcept;
    [[nodiscard]] Result remove(const std::vector<JobId>& ids) noexcept;
    // Snapshot in key order.
    [[nodiscard]] IdListResult ids() const noexcept;

private:
    Database& root_;
    Database& ids_;
};

}
