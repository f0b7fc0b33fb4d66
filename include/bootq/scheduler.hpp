/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>
#include <vector>

#include "bootq/cache.hpp"
#include "bootq/config.hpp"
#include "bootq/database.hpp"
#include "bootq/dependency_graph.hpp"
#include "bootq/job.hpp"
#include "bootq/job_store.hpp"
#include "bootq/missing_set.hpp"
#include "bootq/pending_counter.hpp"
#include "bootq/prefix_database.hpp"
#include "bootq/runnable_queue.hpp"

namespace bootq {

// Key prefixes of the persisted layout.
namespace layout {
constexpr const char* kRunnable = "runnable";
constexpr const char* kJobs = "jobs";
constexpr const char* kDependencies = "dependencies";
constexpr const char* kMissingJobIds = "missing job IDs";
constexpr const char* kPendingJobs = "pendingJobs";
}

// Bookkeeping for bootstrap jobs over one database: the job store, the
// dependency graph, the runnable queue, the missing set and the pending
// counter.
//
// Not synchronized. One owner drives it; callers that reach it from several
// threads must hold a single lock around every call, since dependency
// updates and counter updates are only consistent relative to each other
// when no other call interleaves.
class Scheduler final {
public:
    // `db` and `parser` must outlive the scheduler. Throws std::runtime_error
    // when persisted state cannot be loaded.
    Scheduler(Database& db, const Parser& parser, const SchedulerConfig& config = SchedulerConfig());

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;
    Scheduler(Scheduler&&) = delete;
    Scheduler& operator=(Scheduler&&) = delete;

    [[nodiscard]] Result putJob(const std::shared_ptr<Job>& job) noexcept;
    [[nodiscard]] HasResult hasJob(const JobId& id) const noexcept;
    [[nodiscard]] JobResult getJob(const JobId& id) noexcept;

    [[nodiscard]] Result addRunnableJob(const JobId& id) noexcept;
    [[nodiscard]] HasResult hasRunnableJob() const noexcept;
    // Dequeues the head job and deletes it from the store. The queue entry,
    // the job bytes and the counter change are one batch. An error before
    // the store commits leaves all three as they were. A journaling store
    // that fails after its commit point keeps the batch and refuses writes
    // until reopened, which completes it. Callers escalate errors, they do
    // not retry.
    [[nodiscard]] JobResult removeRunnableJob() noexcept;

    [[nodiscard]] Result addDependency(const JobId& dependency, const JobId& dependent) noexcept;
    [[nodiscard]] IdListResult removeDependencies(const JobId& dependency) noexcept;

    [[nodiscard]] Result addMissingJobIds(const std::vector<JobId>& ids) noexcept;
    [[nodiscard]] Result removeMissingJobIds(const std::vector<JobId>& ids) noexcept;
    [[nodiscard]] IdListResult missingJobIds() const noexcept;

    // One way: flushes both caches and bypasses them from now on.
    void disableCaching() noexcept;
    [[nodiscard]] bool cachingEnabled() const noexcept { return jobStore_.cachingEnabled(); }

    [[nodiscard]] std::uint64_t numPendingJobs() const noexcept { return counter_.value(); }
    [[nodiscard]] std::vector<CacheMetrics> cacheMetrics() const;

private:
    Database& db_;

    PrefixDatabase runnableDb_;
    PrefixDatabase jobsDb_;
    PrefixDatabase dependenciesDb_;
    PrefixDatabase missingDb_;
    PrefixDatabase pendingDb_;

    PendingCounter counter_;
    JobStore jobStore_;
    DependencyGraph graph_;
    RunnableQueue runnable_;
    MissingSet missing_;
};

}
