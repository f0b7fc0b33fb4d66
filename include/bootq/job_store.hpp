/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>
#include <string>

#include "bootq/cache.hpp"
#include "bootq/database.hpp"
#include "bootq/job.hpp"
#include "bootq/pending_counter.hpp"

namespace bootq {

// Job id -> serialized job, fronted by a content cache of parsed jobs.
class JobStore {
public:
    JobStore(Database& root, Database& jobs, const Parser& parser, PendingCounter& counter,
             const std::string& metricsNamespace, std::size_t cacheSize);

    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;

    // Writes the job bytes and the incremented pending counter as one batch.
    [[nodiscard]] Result putJob(const std::shared_ptr<Job>& job) noexcept;
    [[nodiscard]] HasResult hasJob(const JobId& id) const noexcept;
    [[nodiscard]] JobResult getJob(const JobId& id) noexcept;

    // Stages removal of `id`; finishDelete() once the batch committed.
    void stageDelete(WriteBatch& batch, const JobId& id) const;
    void finishDelete(const JobId& id);

    void disableCaching() noexcept;
    [[nodiscard]] bool cachingEnabled() const noexcept { return cachingEnabled_; }
    [[nodiscard]] CacheMetrics cacheMetrics() const { return cache_.metrics(); }

private:
    Database& root_;
    Database& jobs_;
    const Parser& parser_;
    PendingCounter& counter_;

    bool cachingEnabled_ = true;
    MeteredCache<JobId, std::shared_ptr<Job>, JobIdHash> cache_;
};

}
