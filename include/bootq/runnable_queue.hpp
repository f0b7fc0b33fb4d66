/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

#include "bootq/database.hpp"

namespace bootq {

struct RunnableHead {
    bool ok = false;
    std::string key;
    JobId id;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// FIFO of job ids. Entries live at 0x01 || be64(sequence); the next sequence
// number is checkpointed at 0x00 so appends survive restarts without a scan.
class RunnableQueue {
public:
    RunnableQueue(Database& root, Database& list) noexcept;

    RunnableQueue(const RunnableQueue&) = delete;
    RunnableQueue& operator=(const RunnableQueue&) = delete;

    // Loads the sequence checkpoint, deriving it from the last entry when
    // missing.
    [[nodiscard]] Result initialize() noexcept;

    [[nodiscard]] Result push(const JobId& id) noexcept;
    [[nodiscard]] HasResult hasAny() const noexcept;
    // NotFound when empty, ConversionError when the stored id is malformed.
    [[nodiscard]] RunnableHead head() const noexcept;
    void stageRemove(WriteBatch& batch, const std::string& key) const;

    [[nodiscard]] IdListResult list() const noexcept;

    [[nodiscard]] std::uint64_t nextSequence() const noexcept { return nextSequence_; }

private:
    Database& root_;
    Database& list_;
    std::uint64_t nextSequence_ = 0;
};

}
