/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "bootq/missing_set.hpp"
#include "bootq/logger.hpp"

namespace bootq {

MissingSet::MissingSet(Database& root, Database& ids) noexcept
    : root_(root), ids_(ids) {
}

Result MissingSet::add(const std::vector<JobId>& ids) noexcept {
    if (ids.empty()) {
        return Result::success();
    }
    try {
        WriteBatch batch;
        for (const auto& id : ids) {
            ids_.batchPut(batch, id.bytes(), "");
        }
        Result written = root_.commit(batch);
        if (!written) {
            LOG_ERROR("Failed to add " + std::to_string(ids.size()) + " missing id(s): " + written.message);
            return written;
        }
        LOG_DEBUG("Marked " + std::to_string(ids.size()) + " id(s) missing");
        return Result::success();
    } catch (const std::exception& e) {
        return Result::failure(ErrorCode::IoError, e.what());
    }
}

Result MissingSet::remove(const std::vector<JobId>& ids) noexcept {
    if (ids.empty()) {
        return Result::success();
    }
    try {
        WriteBatch batch;
        for (const auto& id : ids) {
            ids_.batchDelete(batch, id.bytes());
        }
        Result written = root_.commit(batch);
        if (!written) {
            LOG_ERROR("Failed to remove " + std::to_string(ids.size()) + " missing id(s): " + written.message);
            return written;
        }
        return Result::success();
    } catch (const std::exception& e) {
        return Result::failure(ErrorCode::IoError, e.what());
    }
}

IdListResult MissingSet::ids() const noexcept {
    try {
        IdListResult result;
        IteratorPtr it = ids_.newIterator();
        while (it->next()) {
            JobId id;
            if (!JobId::fromBytes(it->key(), id)) {
                return {false, {}, ErrorCode::ConversionError,
                        "Malformed missing id of " + std::to_string(it->key().size()) + " bytes"};
            }
            result.ids.push_back(id);
        }
        Result err = it->error();
        if (!err) {
            return {false, {}, err.error, err.message};
        }
        result.ok = true;
        return result;
    } catch (const std::exception& e) {
        return {false, {}, ErrorCode::IoError, e.what()};
    }
}

}
