/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "bootq/job_store.hpp"
#include "bootq/memory_database.hpp"
#include "bootq/pending_counter.hpp"
#include "bootq/prefix_database.hpp"
#include "test_support.hpp"

using namespace bootq;
using test::makeId;

namespace {

class JobStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::quietLogs();
        ASSERT_TRUE(counter.initialize(jobs));
    }

    test::FlakyDatabase db;
    PrefixDatabase jobs{"jobs", db};
    PrefixDatabase pending{"pendingJobs", db};
    PendingCounter counter{pending};
    test::FakeParser parser;
    JobStore store{db, jobs, parser, counter, "bootq", 16};
};

}

TEST_F(JobStoreTest, PutWritesBytesAndCounterTogether) {
    auto job = parser.job(1);
    ASSERT_TRUE(store.putJob(job));

    EXPECT_EQ(db.batches, 1);
    EXPECT_EQ(jobs.get(makeId(1).bytes()).value, job->bytes());
    EXPECT_EQ(counter.value(), 1u);
    EXPECT_EQ(counter.load().value, 1u);
}

TEST_F(JobStoreTest, GetServesCachedInstance) {
    auto job = parser.job(1);
    ASSERT_TRUE(store.putJob(job));

    JobResult fetched = store.getJob(makeId(1));
    ASSERT_TRUE(fetched);
    EXPECT_EQ(fetched.job, job);
    EXPECT_EQ(parser.calls, 0);
    EXPECT_EQ(store.cacheMetrics().hits, 1u);
    EXPECT_EQ(store.cacheMetrics().name, "bootq_jobs_cache");
}

TEST_F(JobStoreTest, GetParsesFromStoreOnMiss) {
    auto job = parser.job(2, {makeId(1)});
    ASSERT_TRUE(jobs.put(makeId(2).bytes(), job->bytes()));

    JobResult fetched = store.getJob(makeId(2));
    ASSERT_TRUE(fetched);
    EXPECT_EQ(fetched.job->id(), makeId(2));
    EXPECT_EQ(fetched.job->bytes(), job->bytes());
    EXPECT_EQ(parser.calls, 1);

    // Now cached
    ASSERT_TRUE(store.getJob(makeId(2)));
    EXPECT_EQ(parser.calls, 1);
}

TEST_F(JobStoreTest, GetReportsNotFoundAndDecodeErrors) {
    JobResult absent = store.getJob(makeId(9));
    EXPECT_FALSE(absent);
    EXPECT_EQ(absent.error, ErrorCode::NotFound);

    ASSERT_TRUE(jobs.put(makeId(3).bytes(), "corrupt"));
    JobResult corrupt = store.getJob(makeId(3));
    EXPECT_FALSE(corrupt);
    EXPECT_EQ(corrupt.error, ErrorCode::DecodeError);
    EXPECT_EQ(corrupt.job, nullptr);
}

TEST_F(JobStoreTest, HasConsultsCacheThenStore) {
    ASSERT_TRUE(store.putJob(parser.job(1)));
    ASSERT_TRUE(jobs.put(makeId(2).bytes(), parser.job(2)->bytes()));

    EXPECT_TRUE(store.hasJob(makeId(1)).value);
    EXPECT_TRUE(store.hasJob(makeId(2)).value);
    EXPECT_FALSE(store.hasJob(makeId(3)).value);
    // Presence checks do not parse
    EXPECT_EQ(parser.calls, 0);
}

TEST_F(JobStoreTest, FailedPutChangesNothing) {
    db.failWrites = true;
    Result r = store.putJob(parser.job(1));
    EXPECT_FALSE(r);
    EXPECT_EQ(r.error, ErrorCode::IoError);

    db.failWrites = false;
    EXPECT_EQ(counter.value(), 0u);
    EXPECT_FALSE(store.hasJob(makeId(1)).value);
    EXPECT_EQ(store.cacheMetrics().size, 0u);
}

TEST_F(JobStoreTest, StagedDeleteEvictsAfterCommit) {
    ASSERT_TRUE(store.putJob(parser.job(1)));

    WriteBatch batch;
    store.stageDelete(batch, makeId(1));
    ASSERT_TRUE(db.commit(batch));
    store.finishDelete(makeId(1));

    EXPECT_FALSE(store.hasJob(makeId(1)).value);
    EXPECT_EQ(store.getJob(makeId(1)).error, ErrorCode::NotFound);
}

TEST_F(JobStoreTest, DisableCachingBypassesCache) {
    ASSERT_TRUE(store.putJob(parser.job(1)));
    store.disableCaching();
    EXPECT_FALSE(store.cachingEnabled());
    EXPECT_EQ(store.cacheMetrics().size, 0u);

    JobResult first = store.getJob(makeId(1));
    JobResult second = store.getJob(makeId(1));
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first.job->bytes(), second.job->bytes());
    EXPECT_EQ(parser.calls, 2);

    ASSERT_TRUE(store.putJob(parser.job(2)));
    EXPECT_EQ(store.cacheMetrics().size, 0u);
    EXPECT_TRUE(store.hasJob(makeId(2)).value);
}

TEST_F(JobStoreTest, NullJobIsRejected) {
    EXPECT_FALSE(store.putJob(nullptr));
    EXPECT_EQ(counter.value(), 0u);
}
