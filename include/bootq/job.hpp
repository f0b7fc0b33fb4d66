/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>
#include <string>

#include "bootq/types.hpp"

namespace bootq {

// A block or vertex waiting to be applied. Implemented by the chain engine;
// the scheduler only needs its id, its bytes and its unmet dependencies.
class Job {
public:
    virtual ~Job() = default;

    [[nodiscard]] virtual JobId id() const = 0;
    [[nodiscard]] virtual std::string bytes() const = 0;

    // Ids this job still waits on, evaluated against current chain state.
    [[nodiscard]] virtual IdListResult missingDependencies() const = 0;

    // Applies the job. Called once, after every dependency executed.
    [[nodiscard]] virtual Result execute() = 0;
};

class Parser {
public:
    virtual ~Parser() = default;

    // DecodeError when `bytes` is not a valid job.
    [[nodiscard]] virtual JobResult parse(const std::string& bytes) const = 0;
};

}
