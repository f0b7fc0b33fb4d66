/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <vector>

#include "bootq/dependency_graph.hpp"
#include "bootq/prefix_database.hpp"
#include "test_support.hpp"

using namespace bootq;
using test::makeId;

namespace {

class DependencyGraphTest : public ::testing::Test {
protected:
    void SetUp() override { test::quietLogs(); }

    test::FlakyDatabase db;
    PrefixDatabase dependencies{"dependencies", db};
    DependencyGraph graph{db, dependencies, "bootq", 4};
};

}

TEST_F(DependencyGraphTest, RemoveReturnsDependentsInKeyOrder) {
    ASSERT_TRUE(graph.addDependency(makeId(1), makeId(30)));
    ASSERT_TRUE(graph.addDependency(makeId(1), makeId(10)));
    ASSERT_TRUE(graph.addDependency(makeId(1), makeId(20)));
    ASSERT_TRUE(graph.addDependency(makeId(2), makeId(40)));

    IdListResult released = graph.removeDependencies(makeId(1));
    ASSERT_TRUE(released);
    EXPECT_EQ(released.ids, (std::vector<JobId>{makeId(10), makeId(20), makeId(30)}));

    // Drained; other buckets untouched
    IdListResult again = graph.removeDependencies(makeId(1));
    ASSERT_TRUE(again);
    EXPECT_TRUE(again.ids.empty());
    EXPECT_EQ(graph.dependents(makeId(2)).ids, (std::vector<JobId>{makeId(40)}));
}

TEST_F(DependencyGraphTest, AddIsIdempotent) {
    ASSERT_TRUE(graph.addDependency(makeId(1), makeId(2)));
    ASSERT_TRUE(graph.addDependency(makeId(1), makeId(2)));

    IdListResult released = graph.removeDependencies(makeId(1));
    ASSERT_TRUE(released);
    EXPECT_EQ(released.ids.size(), 1u);
}

TEST_F(DependencyGraphTest, EdgesLiveUnderDependencyPrefix) {
    ASSERT_TRUE(graph.addDependency(makeId(1), makeId(2)));

    std::string key = std::string("dependencies") + makeId(1).bytes() + makeId(2).bytes();
    HasResult stored = db.has(key);
    ASSERT_TRUE(stored);
    EXPECT_TRUE(stored.value);
    EXPECT_EQ(db.get(key).value, "");
}

TEST_F(DependencyGraphTest, MalformedEntryLeavesBucketIntact) {
    ASSERT_TRUE(graph.addDependency(makeId(1), makeId(2)));
    PrefixDatabase bucket(makeId(1).bytes(), dependencies);
    ASSERT_TRUE(bucket.put("short", ""));

    IdListResult released = graph.removeDependencies(makeId(1));
    EXPECT_FALSE(released);
    EXPECT_EQ(released.error, ErrorCode::ConversionError);
    EXPECT_TRUE(released.ids.empty());
    EXPECT_TRUE(bucket.has(makeId(2).bytes()).value);
}

TEST_F(DependencyGraphTest, FailedCommitReturnsNothing) {
    ASSERT_TRUE(graph.addDependency(makeId(1), makeId(2)));
    db.failWrites = true;

    IdListResult released = graph.removeDependencies(makeId(1));
    EXPECT_FALSE(released);
    EXPECT_TRUE(released.ids.empty());

    db.failWrites = false;
    EXPECT_EQ(graph.dependents(makeId(1)).ids, (std::vector<JobId>{makeId(2)}));
}

TEST_F(DependencyGraphTest, HandleCacheIsTransparent) {
    for (std::uint8_t dep = 1; dep <= 8; ++dep) {
        ASSERT_TRUE(graph.addDependency(makeId(dep), makeId(100)));
    }
    // Capacity 4: early handles were evicted and get rebuilt on demand
    EXPECT_EQ(graph.cacheMetrics().size, 4u);
    EXPECT_EQ(graph.cacheMetrics().name, "bootq_dependents_cache");
    for (std::uint8_t dep = 1; dep <= 8; ++dep) {
        EXPECT_EQ(graph.removeDependencies(makeId(dep)).ids, (std::vector<JobId>{makeId(100)}));
    }
}

TEST_F(DependencyGraphTest, DisableCachingKeepsBehavior) {
    ASSERT_TRUE(graph.addDependency(makeId(1), makeId(2)));
    graph.disableCaching();
    EXPECT_EQ(graph.cacheMetrics().size, 0u);

    ASSERT_TRUE(graph.addDependency(makeId(1), makeId(3)));
    EXPECT_EQ(graph.cacheMetrics().size, 0u);
    EXPECT_EQ(graph.removeDependencies(makeId(1)).ids, (std::vector<JobId>{makeId(2), makeId(3)}));
}
