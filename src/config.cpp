/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "bootq/config.hpp"
#include "bootq/logger.hpp"
#include <cstdlib>
#include <stdexcept>

namespace bootq {

namespace {
std::size_t env_size(const char* name, std::size_t defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        std::size_t parsed = static_cast<std::size_t>(std::stoull(val));
        return parsed == 0 ? defv : parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}
}

SchedulerConfig SchedulerConfig::fromEnv() {
    SchedulerConfig config;
    config.jobsCacheSize = env_size("BOOTQ_JOBS_CACHE_SIZE", config.jobsCacheSize);
    config.dependentsCacheSize = env_size("BOOTQ_DEPENDENTS_CACHE_SIZE", config.dependentsCacheSize);
    if (const char* ns = std::getenv("BOOTQ_METRICS_NAMESPACE")) {
        config.metricsNamespace = ns;
    }
    return config;
}

}
