/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include "bootq/job.hpp"
#include "bootq/scheduler.hpp"

namespace bootq {

// Drives a Scheduler: records incoming jobs with their unmet dependencies and
// executes runnable jobs in order, releasing whatever they unblock.
// Same threading contract as Scheduler.
class JobQueue final {
public:
    explicit JobQueue(Scheduler& scheduler) noexcept;

    JobQueue(const JobQueue&) = delete;
    JobQueue& operator=(const JobQueue&) = delete;

    // value is false when the job was already resident.
    [[nodiscard]] HasResult push(const std::shared_ptr<Job>& job) noexcept;

    // Executes until the queue has nothing runnable or `halted` is set.
    // value is the number of jobs executed. An execution failure stops the
    // loop with ExecutionError; the failed job has already been dequeued.
    [[nodiscard]] CountResult executeAll(const std::atomic<bool>& halted) noexcept;

    [[nodiscard]] std::uint64_t pendingJobs() const noexcept { return scheduler_.numPendingJobs(); }

    [[nodiscard]] Result addMissingIds(const std::vector<JobId>& ids) noexcept { return scheduler_.addMissingJobIds(ids); }
    [[nodiscard]] Result removeMissingIds(const std::vector<JobId>& ids) noexcept { return scheduler_.removeMissingJobIds(ids); }
    [[nodiscard]] IdListResult missingIds() const noexcept { return scheduler_.missingJobIds(); }

    static constexpr std::uint64_t kProgressInterval = 1000;

private:
    Scheduler& scheduler_;

    [[nodiscard]] Result releaseDependents(const JobId& executed) noexcept;
};

}
