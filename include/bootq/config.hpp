/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <string>

namespace bootq {

struct SchedulerConfig {
    std::size_t jobsCacheSize = 2048;
    std::size_t dependentsCacheSize = 1024;
    std::string metricsNamespace = "bootq";

    // Defaults overridden by BOOTQ_JOBS_CACHE_SIZE, BOOTQ_DEPENDENTS_CACHE_SIZE
    // and BOOTQ_METRICS_NAMESPACE. Unparsable or zero sizes keep the default.
    [[nodiscard]] static SchedulerConfig fromEnv();
};

}
