/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "bootq/job_store.hpp"
#include "bootq/logger.hpp"

namespace bootq {

JobStore::JobStore(Database& root, Database& jobs, const Parser& parser, PendingCounter& counter,
                   const std::string& metricsNamespace, std::size_t cacheSize)
    : root_(root),
      jobs_(jobs),
      parser_(parser),
      counter_(counter),
      cache_(metricsNamespace, "jobs_cache", cacheSize) {
}

Result JobStore::putJob(const std::shared_ptr<Job>& job) noexcept {
    if (!job) {
        return Result::failure(ErrorCode::DecodeError, "null job");
    }

    try {
        JobId id = job->id();

        WriteBatch batch;
        jobs_.batchPut(batch, id.bytes(), job->bytes());
        std::uint64_t pending = counter_.stageIncrement(batch);

        Result written = root_.commit(batch);
        if (!written) {
            LOG_ERROR("Failed to put job " + id.hex() + ": " + written.message);
            return written;
        }
        counter_.apply(pending);

        if (cachingEnabled_) {
            cache_.put(id, job);
        }
        LOG_TRACE("Put job " + id.hex() + ", pending " + std::to_string(pending));
        return Result::success();
    } catch (const std::exception& e) {
        LOG_ERROR("Exception putting job: " + std::string(e.what()));
        return Result::failure(ErrorCode::IoError, e.what());
    }
}

HasResult JobStore::hasJob(const JobId& id) const noexcept {
    try {
        if (cachingEnabled_ && cache_.contains(id)) {
            return {true, true, ErrorCode::None, ""};
        }
        return jobs_.has(id.bytes());
    } catch (const std::exception& e) {
        return {false, false, ErrorCode::IoError, e.what()};
    }
}

JobResult JobStore::getJob(const JobId& id) noexcept {
    try {
        if (cachingEnabled_) {
            std::shared_ptr<Job> cached;
            if (cache_.get(id, cached)) {
                return {true, cached, ErrorCode::None, ""};
            }
        }

        ReadResult read = jobs_.get(id.bytes());
        if (!read) {
            if (read.error != ErrorCode::NotFound) {
                LOG_ERROR("Failed to read job " + id.hex() + ": " + read.message);
            }
            return {false, nullptr, read.error, read.message};
        }

        JobResult parsed = parser_.parse(read.value);
        if (!parsed || !parsed.job) {
            LOG_WARN("Failed to decode job " + id.hex() + ": " + parsed.message);
            return {false, nullptr, ErrorCode::DecodeError, parsed.message};
        }

        if (cachingEnabled_) {
            cache_.put(id, parsed.job);
        }
        return parsed;
    } catch (const std::exception& e) {
        LOG_ERROR("Exception getting job " + id.hex() + ": " + e.what());
        return {false, nullptr, ErrorCode::IoError, e.what()};
    }
}

void JobStore::stageDelete(WriteBatch& batch, const JobId& id) const {
    jobs_.batchDelete(batch, id.bytes());
}

void JobStore::finishDelete(const JobId& id) {
    cache_.evict(id);
}

void JobStore::disableCaching() noexcept {
    cache_.flush();
    cachingEnabled_ = false;
}

}
