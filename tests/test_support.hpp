/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "bootq/database.hpp"
#include "bootq/job.hpp"
#include "bootq/logger.hpp"
#include "bootq/memory_database.hpp"
#include "bootq/types.hpp"

namespace bootq::test {

// Id whose every byte is `seed`.
inline JobId makeId(std::uint8_t seed) {
    std::array<std::uint8_t, JobId::kSize> bytes;
    bytes.fill(seed);
    return JobId(bytes);
}

// Chain state shared by every FakeJob of one test: which ids have executed
// and in what order.
struct Chain {
    std::set<JobId> executed;
    std::vector<JobId> order;
    std::set<JobId> failing;
};

// Serialized as: id (32 bytes) || dependency ids (32 bytes each).
class FakeJob final : public Job {
public:
    FakeJob(JobId id, std::vector<JobId> deps, std::shared_ptr<Chain> chain)
        : id_(id), deps_(std::move(deps)), chain_(std::move(chain)) {}

    JobId id() const override { return id_; }

    std::string bytes() const override {
        std::string out = id_.bytes();
        for (const auto& dep : deps_) {
            out += dep.bytes();
        }
        return out;
    }

    IdListResult missingDependencies() const override {
        IdListResult result;
        result.ok = true;
        for (const auto& dep : deps_) {
            if (chain_->executed.count(dep) == 0) {
                result.ids.push_back(dep);
            }
        }
        return result;
    }

    Result execute() override {
        if (chain_->failing.count(id_) != 0) {
            return Result::failure(ErrorCode::ExecutionError, "rejected " + id_.hex());
        }
        chain_->executed.insert(id_);
        chain_->order.push_back(id_);
        return Result::success();
    }

private:
    JobId id_;
    std::vector<JobId> deps_;
    std::shared_ptr<Chain> chain_;
};

class FakeParser final : public Parser {
public:
    explicit FakeParser(std::shared_ptr<Chain> chain = std::make_shared<Chain>())
        : chain_(std::move(chain)) {}

    JobResult parse(const std::string& bytes) const override {
        ++calls;
        if (bytes.empty() || bytes.size() % JobId::kSize != 0) {
            return {false, nullptr, ErrorCode::DecodeError, "bad job length " + std::to_string(bytes.size())};
        }
        JobId id;
        if (!JobId::fromBytes(bytes.substr(0, JobId::kSize), id)) {
            return {false, nullptr, ErrorCode::DecodeError, "bad job id"};
        }
        std::vector<JobId> deps;
        for (std::size_t pos = JobId::kSize; pos < bytes.size(); pos += JobId::kSize) {
            JobId dep;
            if (!JobId::fromBytes(bytes.substr(pos, JobId::kSize), dep)) {
                return {false, nullptr, ErrorCode::DecodeError, "bad dependency id"};
            }
            deps.push_back(dep);
        }
        return {true, std::make_shared<FakeJob>(id, std::move(deps), chain_), ErrorCode::None, ""};
    }

    std::shared_ptr<FakeJob> job(std::uint8_t seed, std::vector<JobId> deps = {}) const {
        return std::make_shared<FakeJob>(makeId(seed), std::move(deps), chain_);
    }

    const std::shared_ptr<Chain>& chain() const { return chain_; }

    mutable int calls = 0;

private:
    std::shared_ptr<Chain> chain_;
};

// MemoryDatabase whose writes can be made to fail.
class FlakyDatabase final : public Database {
public:
    HasResult has(const std::string& key) const noexcept override { return inner_.has(key); }
    ReadResult get(const std::string& key) const noexcept override { return inner_.get(key); }

    Result put(const std::string& key, const std::string& value) noexcept override {
        if (failWrites) return Result::failure(ErrorCode::IoError, "injected put failure");
        return inner_.put(key, value);
    }

    Result del(const std::string& key) noexcept override {
        if (failWrites) return Result::failure(ErrorCode::IoError, "injected delete failure");
        return inner_.del(key);
    }

    IteratorPtr newIterator(const std::string& prefix = "") const override { return inner_.newIterator(prefix); }

    Result write(const WriteBatch& batch) noexcept override {
        ++batches;
        if (failWrites) return Result::failure(ErrorCode::IoError, "injected batch failure");
        return inner_.write(batch);
    }

    MemoryDatabase& inner() { return inner_; }

    bool failWrites = false;
    int batches = 0;

private:
    MemoryDatabase inner_;
};

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("bootq_test_" + std::to_string(stamp) + "_" + std::to_string(counter()++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;

    static int& counter() {
        static int value = 0;
        return value;
    }
};

// Keeps test output to failures only.
inline void quietLogs() {
    Logger::setLevel(LogLevel::ERROR);
}

}
