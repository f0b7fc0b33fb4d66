/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "bootq/scheduler.hpp"
#include "bootq/logger.hpp"
#include <stdexcept>

namespace bootq {

Scheduler::Scheduler(Database& db, const Parser& parser, const SchedulerConfig& config)
    : db_(db),
      runnableDb_(layout::kRunnable, db),
      jobsDb_(layout::kJobs, db),
      dependenciesDb_(layout::kDependencies, db),
      missingDb_(layout::kMissingJobIds, db),
      pendingDb_(layout::kPendingJobs, db),
      counter_(pendingDb_),
      jobStore_(db, jobsDb_, parser, counter_, config.metricsNamespace, config.jobsCacheSize),
      graph_(db, dependenciesDb_, config.metricsNamespace, config.dependentsCacheSize),
      runnable_(db, runnableDb_),
      missing_(db, missingDb_) {
    Result counted = counter_.initialize(jobsDb_);
    if (!counted) {
        throw std::runtime_error("couldn't initialize pending jobs: " + counted.message);
    }
    Result sequenced = runnable_.initialize();
    if (!sequenced) {
        throw std::runtime_error("couldn't initialize runnable queue: " + sequenced.message);
    }

    LOG_DEBUG("Scheduler opened - pending: " + std::to_string(counter_.value()) +
              ", jobs cache: " + std::to_string(config.jobsCacheSize) +
              ", dependents cache: " + std::to_string(config.dependentsCacheSize));
}

Result Scheduler::putJob(const std::shared_ptr<Job>& job) noexcept {
    return jobStore_.putJob(job);
}

HasResult Scheduler::hasJob(const JobId& id) const noexcept {
    return jobStore_.hasJob(id);
}

JobResult Scheduler::getJob(const JobId& id) noexcept {
    return jobStore_.getJob(id);
}

Result Scheduler::addRunnableJob(const JobId& id) noexcept {
    return runnable_.push(id);
}

HasResult Scheduler::hasRunnableJob() const noexcept {
    return runnable_.hasAny();
}

JobResult Scheduler::removeRunnableJob() noexcept {
    RunnableHead head = runnable_.head();
    if (!head) {
        if (head.error != ErrorCode::NotFound) {
            LOG_ERROR("Failed to read runnable queue head: " + head.message);
        }
        return {false, nullptr, head.error, head.message};
    }

    JobResult fetched = jobStore_.getJob(head.id);
    if (!fetched) {
        LOG_ERROR("Runnable job " + head.id.hex() + " unavailable: " + fetched.message);
        return fetched;
    }

    try {
        WriteBatch batch;
        runnable_.stageRemove(batch, head.key);
        jobStore_.stageDelete(batch, head.id);
        std::uint64_t pending = counter_.stageDecrement(batch);

        Result written = db_.commit(batch);
        if (!written) {
            LOG_ERROR("Failed to dequeue job " + head.id.hex() + ": " + written.message);
            return {false, nullptr, written.error, written.message};
        }
        counter_.apply(pending);
        jobStore_.finishDelete(head.id);

        LOG_TRACE("Dequeued job " + head.id.hex() + ", pending " + std::to_string(pending));
        return fetched;
    } catch (const std::exception& e) {
        LOG_ERROR("Exception dequeuing job " + head.id.hex() + ": " + e.what());
        return {false, nullptr, ErrorCode::IoError, e.what()};
    }
}

Result Scheduler::addDependency(const JobId& dependency, const JobId& dependent) noexcept {
    return graph_.addDependency(dependency, dependent);
}

IdListResult Scheduler::removeDependencies(const JobId& dependency) noexcept {
    return graph_.removeDependencies(dependency);
}

Result Scheduler::addMissingJobIds(const std::vector<JobId>& ids) noexcept {
    return missing_.add(ids);
}

Result Scheduler::removeMissingJobIds(const std::vector<JobId>& ids) noexcept {
    return missing_.remove(ids);
}

IdListResult Scheduler::missingJobIds() const noexcept {
    return missing_.ids();
}

void Scheduler::disableCaching() noexcept {
    graph_.disableCaching();
    jobStore_.disableCaching();
    LOG_INFO("Scheduler caching disabled");
}

std::vector<CacheMetrics> Scheduler::cacheMetrics() const {
    return {jobStore_.cacheMetrics(), graph_.cacheMetrics()};
}

}
