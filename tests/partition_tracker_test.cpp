// SPDX-License-Identifier: MIT

// tests/partition_tracker_test.cpp
#include <gtest/gtest.h>

#include <unordered_set>

#include "src/partition_tracker.hpp"
#include "tests/fake_stream.hpp"

using namespace stream_sync;
using namespace stream_sync::test;

TEST(PartitionTrackerTest, StreamWithoutPartitionsIsDoneAfterGeneration) {
    PartitionTracker tracker;
    tracker.AddStream("empty");
    EXPECT_FALSE(tracker.IsStreamDone("empty"));

    tracker.MarkGenerationDone("empty");
    EXPECT_TRUE(tracker.IsGenerationDone("empty"));
    EXPECT_TRUE(tracker.IsStreamDone("empty"));
    EXPECT_EQ(tracker.PartitionCount("empty"), 0u);
}

TEST(PartitionTrackerTest, StreamDoneRequiresEveryPartition) {
    PartitionTracker tracker;
    tracker.AddStream("users");
    auto p0 = tracker.RegisterPartition("users");
    auto p1 = tracker.RegisterPartition("users");
    ASSERT_TRUE(p0.has_value());
    ASSERT_TRUE(p1.has_value());
    EXPECT_NE(*p0, *p1);
    EXPECT_EQ(tracker.OpenPartitionCount("users"), 2u);

    EXPECT_TRUE(tracker.MarkPartitionDone(*p0));
    tracker.MarkGenerationDone("users");
    EXPECT_FALSE(tracker.IsStreamDone("users"));
    EXPECT_FALSE(tracker.AllPartitionsDone());

    EXPECT_TRUE(tracker.MarkPartitionDone(*p1));
    EXPECT_TRUE(tracker.IsStreamDone("users"));
    EXPECT_TRUE(tracker.AllPartitionsDone());
}

TEST(PartitionTrackerTest, PartitionsDoneBeforeGenerationIsNotDone) {
    PartitionTracker tracker;
    tracker.AddStream("orders");
    auto p = tracker.RegisterPartition("orders");
    ASSERT_TRUE(p.has_value());
    EXPECT_TRUE(tracker.MarkPartitionDone(*p));
    EXPECT_FALSE(tracker.IsStreamDone("orders"));
}

TEST(PartitionTrackerTest, DuplicateAndUnknownCompletionsAreRejected) {
    PartitionTracker tracker;
    tracker.AddStream("users");
    auto p = tracker.RegisterPartition("users");
    ASSERT_TRUE(p.has_value());

    EXPECT_TRUE(tracker.MarkPartitionDone(*p));
    EXPECT_FALSE(tracker.MarkPartitionDone(*p));
    EXPECT_FALSE(tracker.MarkPartitionDone(*p + 100));
    EXPECT_EQ(tracker.OpenPartitionCount("users"), 0u);
}

TEST(PartitionTrackerTest, RegisterForUntrackedStreamFails) {
    PartitionTracker tracker;
    auto p = tracker.RegisterPartition("ghost");
    ASSERT_FALSE(p.has_value());
    EXPECT_EQ(p.error().code, ErrorCode::InvalidState);
}

TEST(PartitionTrackerTest, IdsMapBackToTheirStream) {
    PartitionTracker tracker;
    tracker.AddStream("a");
    tracker.AddStream("b");
    auto pa = tracker.RegisterPartition("a");
    auto pb = tracker.RegisterPartition("b");
    ASSERT_TRUE(pa && pb);

    ASSERT_NE(tracker.StreamOf(*pa), nullptr);
    EXPECT_EQ(*tracker.StreamOf(*pa), "a");
    EXPECT_EQ(*tracker.StreamOf(*pb), "b");
    EXPECT_EQ(tracker.StreamOf(*pb + 1), nullptr);

    // Completing b's partition leaves a untouched
    EXPECT_TRUE(tracker.MarkPartitionDone(*pb));
    EXPECT_EQ(tracker.OpenPartitionCount("a"), 1u);
}

TEST(PartitionIdentityTest, EqualityUsesStreamAndKey) {
    FakePartition a("users", "p0");
    FakePartition same("users", "p0", {.records = {"{}"}});
    FakePartition other_key("users", "p1");
    FakePartition other_stream("orders", "p0");

    EXPECT_TRUE(a == same);
    EXPECT_FALSE(a == other_key);
    EXPECT_FALSE(a == other_stream);
    EXPECT_EQ(PartitionHash{}(a), PartitionHash{}(same));
}

TEST(PartitionIdentityTest, HashSupportsUnorderedSets) {
    auto key_of = [](const Partition* p) { return PartitionHash{}(*p); };
    auto equal = [](const Partition* a, const Partition* b) { return *a == *b; };
    std::unordered_set<const Partition*, decltype(key_of), decltype(equal)> seen(8, key_of, equal);

    FakePartition a("users", "p0");
    FakePartition a_again("users", "p0");
    FakePartition b("users", "p1");
    EXPECT_TRUE(seen.insert(&a).second);
    EXPECT_FALSE(seen.insert(&a_again).second);
    EXPECT_TRUE(seen.insert(&b).second);
    EXPECT_EQ(seen.size(), 2u);
}
