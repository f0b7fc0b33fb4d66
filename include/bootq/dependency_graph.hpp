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
#include "bootq/prefix_database.hpp"

namespace bootq {

// dependency id -> set of dependent ids. Each dependency owns the
// sub-namespace `dependencies/<dependency id>`; its keys are dependent ids.
class DependencyGraph {
public:
    DependencyGraph(Database& root, Database& dependencies,
                    const std::string& metricsNamespace, std::size_t handleCacheSize);

    DependencyGraph(const DependencyGraph&) = delete;
    DependencyGraph& operator=(const DependencyGraph&) = delete;

    // Idempotent.
    [[nodiscard]] Result addDependency(const JobId& dependency, const JobId& dependent) noexcept;

    // Pops every dependent of `dependency` in key order. All entries are read
    // and converted before anything is deleted, and the deletes commit as one
    // batch: on error the bucket is left untouched and no ids are returned.
    [[nodiscard]] IdListResult removeDependencies(const JobId& dependency) noexcept;

    // Read-only view of one bucket.
    [[nodiscard]] IdListResult dependents(const JobId& dependency) noexcept;

    void disableCaching() noexcept;
    [[nodiscard]] CacheMetrics cacheMetrics() const { return handles_.metrics(); }

private:
    using Bucket = std::shared_ptr<PrefixDatabase>;

    Database& root_;
    Database& dependencies_;
    bool cachingEnabled_ = true;
    MeteredCache<JobId, Bucket, JobIdHash> handles_;

    [[nodiscard]] Bucket bucket(const JobId& dependency);
    [[nodiscard]] IdListResult collect(const Database& bucket) const;
};

}
