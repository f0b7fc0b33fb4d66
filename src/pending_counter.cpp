/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "bootq/pending_counter.hpp"
#include "bootq/logger.hpp"

namespace bootq {

namespace {
const std::string kPendingJobsKey = "pendingJobs";
}

PendingCounter::PendingCounter(Database& db) noexcept : db_(db) {
}

CountResult PendingCounter::load() const noexcept {
    return getUint64(db_, kPendingJobsKey);
}

Result PendingCounter::initialize(const Database& jobs) noexcept {
    CountResult checkpoint = load();
    if (checkpoint) {
        count_ = checkpoint.value;
        LOG_DEBUG("Pending jobs checkpoint: " + std::to_string(count_));
        return Result::success();
    }
    if (checkpoint.error != ErrorCode::NotFound) {
        LOG_ERROR("Failed to read pending jobs checkpoint: " + checkpoint.message);
        return Result::failure(checkpoint.error, checkpoint.message);
    }

    // Queues persisted before checkpoints existed: count once, then persist
    // so this path is not taken again.
    LOG_WARN("No pending jobs checkpoint, scanning job store");
    CountResult scanned = countEntries(jobs);
    if (!scanned) {
        LOG_ERROR("Failed to scan job store: " + scanned.message);
        return Result::failure(scanned.error, scanned.message);
    }

    Result persisted = db_.put(kPendingJobsKey, encodeUint64(scanned.value));
    if (!persisted) {
        LOG_ERROR("Failed to persist pending jobs checkpoint: " + persisted.message);
        return persisted;
    }

    count_ = scanned.value;
    LOG_INFO("Recovered pending jobs count: " + std::to_string(count_));
    return Result::success();
}

std::uint64_t PendingCounter::stageIncrement(WriteBatch& batch) const {
    std::uint64_t next = count_ + 1;
    db_.batchPut(batch, kPendingJobsKey, encodeUint64(next));
    return next;
}

std::uint64_t PendingCounter::stageDecrement(WriteBatch& batch) const {
    if (count_ == 0) {
        LOG_WARN("Pending jobs counter already zero, not decrementing");
        return 0;
    }
    std::uint64_t next = count_ - 1;
    db_.batchPut(batch, kPendingJobsKey, encodeUint64(next));
    return next;
}

}
