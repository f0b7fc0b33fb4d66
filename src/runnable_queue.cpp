/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "bootq/runnable_queue.hpp"
#include "bootq/logger.hpp"

namespace bootq {

namespace {
const std::string kSequenceKey(1, '\x00');
const std::string kEntryPrefix(1, '\x01');

std::string entryKey(std::uint64_t sequence) {
    return kEntryPrefix + encodeUint64(sequence);
}
}

RunnableQueue::RunnableQueue(Database& root, Database& list) noexcept
    : root_(root), list_(list) {
}

Result RunnableQueue::initialize() noexcept {
    try {
        CountResult checkpoint = getUint64(list_, kSequenceKey);
        if (checkpoint) {
            nextSequence_ = checkpoint.value;
            return Result::success();
        }
        if (checkpoint.error != ErrorCode::NotFound) {
            LOG_ERROR("Failed to read runnable sequence: " + checkpoint.message);
            return Result::failure(checkpoint.error, checkpoint.message);
        }

        std::uint64_t next = 0;
        IteratorPtr it = list_.newIterator(kEntryPrefix);
        while (it->next()) {
            std::uint64_t sequence = 0;
            if (!decodeUint64(it->key().substr(kEntryPrefix.size()), sequence)) {
                return Result::failure(ErrorCode::ConversionError, "Malformed runnable entry key");
            }
            next = sequence + 1;
        }
        Result err = it->error();
        if (!err) {
            return err;
        }
        nextSequence_ = next;
        return Result::success();
    } catch (const std::exception& e) {
        return Result::failure(ErrorCode::IoError, e.what());
    }
}

Result RunnableQueue::push(const JobId& id) noexcept {
    try {
        WriteBatch batch;
        list_.batchPut(batch, entryKey(nextSequence_), id.bytes());
        list_.batchPut(batch, kSequenceKey, encodeUint64(nextSequence_ + 1));

        Result written = root_.commit(batch);
        if (!written) {
            LOG_ERROR("Failed to enqueue runnable job " + id.hex() + ": " + written.message);
            return written;
        }
        ++nextSequence_;
        LOG_TRACE("Runnable job queued: " + id.hex());
        return Result::success();
    } catch (const std::exception& e) {
        return Result::failure(ErrorCode::IoError, e.what());
    }
}

HasResult RunnableQueue::hasAny() const noexcept {
    try {
        IteratorPtr it = list_.newIterator(kEntryPrefix);
        bool found = it->next();
        Result err = it->error();
        if (!err) {
            return {false, false, err.error, err.message};
        }
        return {true, found, ErrorCode::None, ""};
    } catch (const std::exception& e) {
        return {false, false, ErrorCode::IoError, e.what()};
    }
}

RunnableHead RunnableQueue::head() const noexcept {
    RunnableHead head;
    try {
        IteratorPtr it = list_.newIterator(kEntryPrefix);
        if (!it->next()) {
            Result err = it->error();
            head.error = err ? ErrorCode::NotFound : err.error;
            head.message = err ? "runnable queue is empty" : err.message;
            return head;
        }

        head.key = it->key();
        const std::string& raw = it->value();
        Result err = it->error();
        if (!err) {
            head.error = err.error;
            head.message = err.message;
            return head;
        }
        if (!JobId::fromBytes(raw, head.id)) {
            head.error = ErrorCode::ConversionError;
            head.message = "Couldn't convert job ID bytes to job ID";
            return head;
        }
        head.ok = true;
        return head;
    } catch (const std::exception& e) {
        head.error = ErrorCode::IoError;
        head.message = e.what();
        return head;
    }
}

void RunnableQueue::stageRemove(WriteBatch& batch, const std::string& key) const {
    list_.batchDelete(batch, key);
}

IdListResult RunnableQueue::list() const noexcept {
    try {
        IdListResult result;
        IteratorPtr it = list_.newIterator(kEntryPrefix);
        while (it->next()) {
            JobId id;
            if (!JobId::fromBytes(it->value(), id)) {
                return {false, {}, ErrorCode::ConversionError, "Couldn't convert job ID bytes to job ID"};
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
