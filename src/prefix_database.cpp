/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "bootq/prefix_database.hpp"

namespace bootq {

namespace {

// Strips the view prefix from keys produced by the parent iterator.
class PrefixIterator final : public Iterator {
public:
    PrefixIterator(IteratorPtr inner, std::size_t strip) noexcept
        : inner_(std::move(inner)), strip_(strip) {}

    bool next() override {
        if (!inner_ || !inner_->next()) {
            return false;
        }
        key_ = inner_->key().substr(strip_);
        return true;
    }

    [[nodiscard]] const std::string& key() const override { return key_; }
    [[nodiscard]] const std::string& value() const override {
        return inner_ ? inner_->value() : key_;
    }
    [[nodiscard]] Result error() const override {
        return inner_ ? inner_->error() : Result::success();
    }

    void release() noexcept override {
        if (inner_) {
            inner_->release();
            inner_.reset();
        }
        key_.clear();
    }

private:
    IteratorPtr inner_;
    std::size_t strip_;
    std::string key_;
};

}

PrefixDatabase::PrefixDatabase(std::string prefix, Database& parent) noexcept
    : prefix_(std::move(prefix)), parent_(parent) {
}

HasResult PrefixDatabase::has(const std::string& key) const noexcept {
    try {
        return parent_.has(wrap(key));
    } catch (const std::exception& e) {
        return {false, false, ErrorCode::IoError, e.what()};
    }
}

ReadResult PrefixDatabase::get(const std::string& key) const noexcept {
    try {
        return parent_.get(wrap(key));
    } catch (const std::exception& e) {
        return {false, "", ErrorCode::IoError, e.what()};
    }
}

Result PrefixDatabase::put(const std::string& key, const std::string& value) noexcept {
    try {
        return parent_.put(wrap(key), value);
    } catch (const std::exception& e) {
        return Result::failure(ErrorCode::IoError, e.what());
    }
}

Result PrefixDatabase::del(const std::string& key) noexcept {
    try {
        return parent_.del(wrap(key));
    } catch (const std::exception& e) {
        return Result::failure(ErrorCode::IoError, e.what());
    }
}

IteratorPtr PrefixDatabase::newIterator(const std::string& prefix) const {
    return std::make_unique<PrefixIterator>(parent_.newIterator(wrap(prefix)), prefix_.size());
}

Result PrefixDatabase::write(const WriteBatch& batch) noexcept {
    try {
        WriteBatch wrapped;
        for (const auto& op : batch.ops()) {
            if (op.type == WriteBatch::OpType::Put) {
                wrapped.put(wrap(op.key), op.value);
            } else {
                wrapped.del(wrap(op.key));
            }
        }
        return parent_.write(wrapped);
    } catch (const std::exception& e) {
        return Result::failure(ErrorCode::IoError, e.what());
    }
}

void PrefixDatabase::batchPut(WriteBatch& batch, const std::string& key, const std::string& value) const {
    parent_.batchPut(batch, wrap(key), value);
}

void PrefixDatabase::batchDelete(WriteBatch& batch, const std::string& key) const {
    parent_.batchDelete(batch, wrap(key));
}

}
