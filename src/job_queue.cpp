/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "bootq/job_queue.hpp"
#include "bootq/logger.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>

namespace bootq {

JobQueue::JobQueue(Scheduler& scheduler) noexcept : scheduler_(scheduler) {
}

HasResult JobQueue::push(const std::shared_ptr<Job>& job) noexcept {
    if (!job) {
        return {false, false, ErrorCode::DecodeError, "null job"};
    }

    try {
        JobId id = job->id();

        HasResult resident = scheduler_.hasJob(id);
        if (!resident) {
            return resident;
        }
        if (resident.value) {
            LOG_TRACE("Job already queued: " + id.hex());
            return {true, false, ErrorCode::None, ""};
        }

        IdListResult deps = job->missingDependencies();
        if (!deps) {
            LOG_ERROR("Failed to resolve dependencies of " + id.hex() + ": " + deps.message);
            return {false, false, deps.error, deps.message};
        }

        for (const auto& dep : deps.ids) {
            Result added = scheduler_.addDependency(dep, id);
            if (!added) {
                return {false, false, added.error, added.message};
            }
        }

        Result put = scheduler_.putJob(job);
        if (!put) {
            return {false, false, put.error, put.message};
        }

        if (deps.ids.empty()) {
            Result queued = scheduler_.addRunnableJob(id);
            if (!queued) {
                return {false, false, queued.error, queued.message};
            }
        }

        LOG_DEBUG("Job pushed: " + id.hex() + " (" + std::to_string(deps.ids.size()) + " unmet dependencies)");
        return {true, true, ErrorCode::None, ""};
    } catch (const std::exception& e) {
        LOG_ERROR("Exception pushing job: " + std::string(e.what()));
        return {false, false, ErrorCode::IoError, e.what()};
    }
}

CountResult JobQueue::executeAll(const std::atomic<bool>& halted) noexcept {
    auto startTime = std::chrono::steady_clock::now();
    std::uint64_t executed = 0;

    LOG_INFO("Executing jobs, " + std::to_string(scheduler_.numPendingJobs()) + " pending");

    while (!halted.load()) {
        HasResult runnable = scheduler_.hasRunnableJob();
        if (!runnable) {
            return {false, executed, runnable.error, runnable.message};
        }
        if (!runnable.value) {
            break;
        }

        JobResult next = scheduler_.removeRunnableJob();
        if (!next) {
            LOG_ERROR("Failed to dequeue runnable job: " + next.message);
            return {false, executed, next.error, next.message};
        }

        JobId id = next.job->id();
        Result ran = next.job->execute();
        if (!ran) {
            LOG_ERROR("Failed to execute job " + id.hex() + ": " + ran.message);
            return {false, executed, ErrorCode::ExecutionError, ran.message};
        }

        Result released = releaseDependents(id);
        if (!released) {
            return {false, executed, released.error, released.message};
        }

        ++executed;
        if (executed % kProgressInterval == 0) {
            LOG_INFO("Executed " + std::to_string(executed) + " jobs, " +
                     std::to_string(scheduler_.numPendingJobs()) + " pending");
        }
    }

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
    std::ostringstream summary;
    summary << (halted.load() ? "Halted after " : "Finished executing ") << executed
            << " jobs in " << std::fixed << std::setprecision(1) << elapsed << "s";
    LOG_INFO(summary.str());

    return {true, executed, ErrorCode::None, ""};
}

Result JobQueue::releaseDependents(const JobId& executed) noexcept {
    IdListResult dependents = scheduler_.removeDependencies(executed);
    if (!dependents) {
        LOG_ERROR("Failed to release dependents of " + executed.hex() + ": " + dependents.message);
        return Result::failure(dependents.error, dependents.message);
    }

    for (const auto& dependentId : dependents.ids) {
        JobResult dependent = scheduler_.getJob(dependentId);
        if (!dependent) {
            LOG_ERROR("Blocked job " + dependentId.hex() + " unavailable: " + dependent.message);
            return Result::failure(dependent.error, dependent.message);
        }

        IdListResult missing = dependent.job->missingDependencies();
        if (!missing) {
            return Result::failure(missing.error, missing.message);
        }
        if (!missing.ids.empty()) {
            LOG_TRACE("Job " + dependentId.hex() + " still blocked on " +
                      std::to_string(missing.ids.size()) + " dependencies");
            continue;
        }

        Result queued = scheduler_.addRunnableJob(dependentId);
        if (!queued) {
            return queued;
        }
    }
    return Result::success();
}

}
