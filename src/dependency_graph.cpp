/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "bootq/dependency_graph.hpp"
#include "bootq/logger.hpp"

namespace bootq {

DependencyGraph::DependencyGraph(Database& root, Database& dependencies,
                                 const std::string& metricsNamespace, std::size_t handleCacheSize)
    : root_(root),
      dependencies_(dependencies),
      handles_(metricsNamespace, "dependents_cache", handleCacheSize) {
}

DependencyGraph::Bucket DependencyGraph::bucket(const JobId& dependency) {
    Bucket handle;
    if (cachingEnabled_ && handles_.get(dependency, handle)) {
        return handle;
    }

    handle = std::make_shared<PrefixDatabase>(dependency.bytes(), dependencies_);
    if (cachingEnabled_) {
        handles_.put(dependency, handle);
    }
    return handle;
}

Result DependencyGraph::addDependency(const JobId& dependency, const JobId& dependent) noexcept {
    try {
        Result r = bucket(dependency)->put(dependent.bytes(), "");
        if (!r) {
            LOG_ERROR("Failed to add dependency " + dependency.hex() + " -> " + dependent.hex() + ": " + r.message);
            return r;
        }
        LOG_TRACE("Job " + dependent.hex() + " blocked on " + dependency.hex());
        return Result::success();
    } catch (const std::exception& e) {
        return Result::failure(ErrorCode::IoError, e.what());
    }
}

IdListResult DependencyGraph::collect(const Database& bucket) const {
    IdListResult result;
    IteratorPtr it = bucket.newIterator();
    while (it->next()) {
        JobId dependent;
        if (!JobId::fromBytes(it->key(), dependent)) {
            return {false, {}, ErrorCode::ConversionError,
                    "Malformed dependent id of " + std::to_string(it->key().size()) + " bytes"};
        }
        result.ids.push_back(dependent);
    }

    Result err = it->error();
    if (!err) {
        return {false, {}, err.error, err.message};
    }
    result.ok = true;
    return result;
}

IdListResult DependencyGraph::dependents(const JobId& dependency) noexcept {
    try {
        return collect(*bucket(dependency));
    } catch (const std::exception& e) {
        return {false, {}, ErrorCode::IoError, e.what()};
    }
}

IdListResult DependencyGraph::removeDependencies(const JobId& dependency) noexcept {
    try {
        Bucket handle = bucket(dependency);

        IdListResult collected = collect(*handle);
        if (!collected) {
            LOG_ERROR("Failed to read dependents of " + dependency.hex() + ": " + collected.message);
            return collected;
        }
        if (collected.ids.empty()) {
            return collected;
        }

        WriteBatch batch;
        for (const auto& dependent : collected.ids) {
            handle->batchDelete(batch, dependent.bytes());
        }

        Result written = root_.commit(batch);
        if (!written) {
            LOG_ERROR("Failed to remove dependents of " + dependency.hex() + ": " + written.message);
            return {false, {}, written.error, written.message};
        }

        LOG_TRACE("Released " + std::to_string(collected.ids.size()) + " dependent(s) of " + dependency.hex());
        return collected;
    } catch (const std::exception& e) {
        return {false, {}, ErrorCode::IoError, e.what()};
    }
}

void DependencyGraph::disableCaching() noexcept {
    handles_.flush();
    cachingEnabled_ = false;
}

}
