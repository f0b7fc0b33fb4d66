/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <string>
#include <unordered_set>

#include "bootq/types.hpp"
#include "test_support.hpp"

using namespace bootq;
using bootq::test::makeId;

TEST(JobIdTest, HexRoundTrip) {
    JobId id = makeId(0xab);
    EXPECT_EQ(id.hex().size(), 64u);

    JobId parsed;
    ASSERT_TRUE(JobId::fromHex(id.hex(), parsed));
    EXPECT_EQ(parsed, id);

    std::string expected;
    for (int i = 0; i < 32; ++i) expected += "ab";
    EXPECT_EQ(id.hex(), expected);
}

TEST(JobIdTest, FromHexAcceptsUpperCase) {
    std::string upper;
    for (int i = 0; i < 32; ++i) upper += "CD";
    JobId parsed;
    ASSERT_TRUE(JobId::fromHex(upper, parsed));
    EXPECT_EQ(parsed, makeId(0xcd));
}

TEST(JobIdTest, FromHexRejectsBadInput) {
    JobId out = makeId(1);
    EXPECT_FALSE(JobId::fromHex("abcd", out));
    EXPECT_FALSE(JobId::fromHex(std::string(64, 'g'), out));
    EXPECT_EQ(out, makeId(1));
}

TEST(JobIdTest, FromBytesRequiresExactWidth) {
    JobId out = makeId(7);
    EXPECT_FALSE(JobId::fromBytes(std::string(31, 'x'), out));
    EXPECT_FALSE(JobId::fromBytes(std::string(33, 'x'), out));
    EXPECT_EQ(out, makeId(7));

    ASSERT_TRUE(JobId::fromBytes(makeId(9).bytes(), out));
    EXPECT_EQ(out, makeId(9));
}

TEST(JobIdTest, EmptyAndOrdering) {
    EXPECT_TRUE(JobId().empty());
    EXPECT_FALSE(makeId(1).empty());
    EXPECT_LT(makeId(1), makeId(2));
    EXPECT_NE(makeId(1), makeId(2));
}

TEST(JobIdTest, UsableAsHashKey) {
    std::unordered_set<JobId, JobIdHash> ids;
    ids.insert(makeId(1));
    ids.insert(makeId(2));
    ids.insert(makeId(1));
    EXPECT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids.count(makeId(2)), 1u);
}

TEST(ResultTest, FailureCarriesCodeAndMessage) {
    Result ok = Result::success();
    EXPECT_TRUE(static_cast<bool>(ok));

    Result failed = Result::failure(ErrorCode::NotFound, "gone");
    EXPECT_FALSE(static_cast<bool>(failed));
    EXPECT_EQ(failed.error, ErrorCode::NotFound);
    EXPECT_EQ(failed.message, "gone");
    EXPECT_STREQ(errorCodeToString(failed.error), "not found");
    EXPECT_STREQ(errorCodeToString(ErrorCode::ConversionError), "conversion error");
}
