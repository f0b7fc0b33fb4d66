/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <vector>

#include "bootq/file_database.hpp"
#include "bootq/memory_database.hpp"
#include "bootq/prefix_database.hpp"
#include "bootq/runnable_queue.hpp"
#include "test_support.hpp"

using namespace bootq;
using test::makeId;

namespace {

// Dequeues through the same path the scheduler uses.
JobId pop(Database& root, RunnableQueue& queue) {
    RunnableHead head = queue.head();
    EXPECT_TRUE(head);
    WriteBatch batch;
    queue.stageRemove(batch, head.key);
    EXPECT_TRUE(root.commit(batch));
    return head.id;
}

class RunnableQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::quietLogs();
        ASSERT_TRUE(queue.initialize());
    }

    MemoryDatabase db;
    PrefixDatabase list{"runnable", db};
    RunnableQueue queue{db, list};
};

}

TEST_F(RunnableQueueTest, EmptyQueue) {
    HasResult any = queue.hasAny();
    ASSERT_TRUE(any);
    EXPECT_FALSE(any.value);

    RunnableHead head = queue.head();
    EXPECT_FALSE(head);
    EXPECT_EQ(head.error, ErrorCode::NotFound);
}

TEST_F(RunnableQueueTest, FifoOrder) {
    ASSERT_TRUE(queue.push(makeId(3)));
    ASSERT_TRUE(queue.push(makeId(1)));
    ASSERT_TRUE(queue.push(makeId(2)));

    EXPECT_EQ(queue.list().ids, (std::vector<JobId>{makeId(3), makeId(1), makeId(2)}));
    EXPECT_EQ(pop(db, queue), makeId(3));
    EXPECT_EQ(pop(db, queue), makeId(1));

    ASSERT_TRUE(queue.push(makeId(4)));
    EXPECT_EQ(pop(db, queue), makeId(2));
    EXPECT_EQ(pop(db, queue), makeId(4));
    EXPECT_FALSE(queue.hasAny().value);
}

TEST_F(RunnableQueueTest, DuplicatesAreKept) {
    ASSERT_TRUE(queue.push(makeId(1)));
    ASSERT_TRUE(queue.push(makeId(1)));
    EXPECT_EQ(queue.list().ids.size(), 2u);
}

TEST_F(RunnableQueueTest, MalformedHeadIsConversionError) {
    std::string entry = std::string(1, '\x01') + encodeUint64(0);
    ASSERT_TRUE(list.put(entry, "not an id"));

    RunnableHead head = queue.head();
    EXPECT_FALSE(head);
    EXPECT_EQ(head.error, ErrorCode::ConversionError);
}

TEST_F(RunnableQueueTest, SequenceSurvivesReopen) {
    test::TempDir dir;
    {
        FileDatabase store(dir.path());
        PrefixDatabase runnable("runnable", store);
        RunnableQueue first(store, runnable);
        ASSERT_TRUE(first.initialize());
        ASSERT_TRUE(first.push(makeId(1)));
        ASSERT_TRUE(first.push(makeId(2)));
        EXPECT_EQ(pop(store, first), makeId(1));
        EXPECT_EQ(first.nextSequence(), 2u);
    }

    FileDatabase store(dir.path());
    PrefixDatabase runnable("runnable", store);
    RunnableQueue reopened(store, runnable);
    ASSERT_TRUE(reopened.initialize());
    EXPECT_EQ(reopened.nextSequence(), 2u);

    ASSERT_TRUE(reopened.push(makeId(3)));
    EXPECT_EQ(reopened.list().ids, (std::vector<JobId>{makeId(2), makeId(3)}));
}

TEST_F(RunnableQueueTest, SequenceDerivedFromEntriesWithoutCheckpoint) {
    ASSERT_TRUE(list.put(std::string(1, '\x01') + encodeUint64(5), makeId(7).bytes()));

    RunnableQueue recovered(db, list);
    ASSERT_TRUE(recovered.initialize());
    EXPECT_EQ(recovered.nextSequence(), 6u);

    ASSERT_TRUE(recovered.push(makeId(8)));
    EXPECT_EQ(recovered.list().ids, (std::vector<JobId>{makeId(7), makeId(8)}));
}
