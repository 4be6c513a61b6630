#include "scheduling/AdaptivePriorityQueue.h"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace GAIA {
namespace Test {

class AdaptivePriorityQueueTest : public ::testing::Test {
protected:
    static std::vector<std::string> ids(const std::vector<TestItem> &items) {
        std::vector<std::string> result;
        for (const auto &item : items) {
            result.push_back(item.id);
        }
        return result;
    }

    std::vector<std::string> drain() {
        std::vector<std::string> order;
        while (auto item = queue_.pop()) {
            order.push_back(item->id);
        }
        return order;
    }

    AdaptivePriorityQueue queue_;
    GAIAState state_;
};

TEST_F(AdaptivePriorityQueueTest, ZeroCapacityIsRejected) {
    EXPECT_THROW(AdaptivePriorityQueue(0), std::invalid_argument);
}

TEST_F(AdaptivePriorityQueueTest, PushRequiresId) {
    EXPECT_THROW(queue_.push(TestItem("", "MUST"), state_), std::invalid_argument);
    EXPECT_TRUE(queue_.empty());
}

TEST_F(AdaptivePriorityQueueTest, HighestScorePopsFirst) {
    queue_.push(TestItem("may", "MAY"), state_);
    queue_.push(TestItem("must", "MUST"), state_);
    queue_.push(TestItem("should", "SHOULD"), state_);

    EXPECT_EQ(drain(), (std::vector<std::string>{"must", "should", "may"}));
}

TEST_F(AdaptivePriorityQueueTest, EqualScoresPopInPushOrder) {
    for (const char *id : {"T1", "T2", "T3", "T4"}) {
        queue_.push(TestItem(id, "SHOULD"), state_);
    }
    EXPECT_EQ(drain(), (std::vector<std::string>{"T1", "T2", "T3", "T4"}));
}

TEST_F(AdaptivePriorityQueueTest, PopAndPeekOnEmptyQueue) {
    EXPECT_FALSE(queue_.pop().has_value());
    EXPECT_FALSE(queue_.peek().has_value());
}

TEST_F(AdaptivePriorityQueueTest, PeekDoesNotRemove) {
    queue_.push(TestItem("T1", "MUST"), state_);
    auto peeked = queue_.peek();
    ASSERT_TRUE(peeked.has_value());
    EXPECT_EQ(peeked->id, "T1");
    EXPECT_EQ(queue_.size(), 1u);
}

TEST_F(AdaptivePriorityQueueTest, CompletedItemsAreNotQueued) {
    state_.markTestCompleted("done");
    queue_.push(TestItem("done", "MUST"), state_);
    EXPECT_EQ(queue_.size(), 0u);
    EXPECT_FALSE(queue_.contains("done"));
}

TEST_F(AdaptivePriorityQueueTest, OverCapacityEvictsLowestScores) {
    AdaptivePriorityQueue small(2);
    small.push(TestItem("may", "MAY"), state_);
    small.push(TestItem("must", "MUST"), state_);
    small.push(TestItem("should", "SHOULD"), state_);

    EXPECT_EQ(small.size(), 2u);
    EXPECT_TRUE(small.contains("must"));
    EXPECT_TRUE(small.contains("should"));
    EXPECT_FALSE(small.contains("may"));
}

TEST_F(AdaptivePriorityQueueTest, EvictionAmongEqualScoresDropsNewest) {
    AdaptivePriorityQueue small(2);
    small.push(TestItem("first", "MAY"), state_);
    small.push(TestItem("second", "MAY"), state_);
    small.push(TestItem("third", "MAY"), state_);

    EXPECT_EQ(ids(small.getTopN(10)), (std::vector<std::string>{"first", "second"}));
}

TEST_F(AdaptivePriorityQueueTest, GetTopNIsOrderedAndNonDestructive) {
    queue_.push(TestItem("may", "MAY"), state_);
    queue_.push(TestItem("must", "MUST"), state_);
    queue_.push(TestItem("should", "SHOULD"), state_);

    EXPECT_EQ(ids(queue_.getTopN(2)), (std::vector<std::string>{"must", "should"}));
    EXPECT_EQ(queue_.getTopN(10).size(), 3u);
    EXPECT_TRUE(queue_.getTopN(0).empty());
    EXPECT_EQ(queue_.size(), 3u);
}

TEST_F(AdaptivePriorityQueueTest, TopEntriesCarryQueuedScores) {
    TestItem item("C1", "MUST");
    item.newElements = 2;
    item.targetUrl = "https://c1.com";
    queue_.push(item, state_);

    auto entries = queue_.getTopEntries(1);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].score, 150);
    EXPECT_EQ(entries[0].item.id, "C1");
}

TEST_F(AdaptivePriorityQueueTest, RescoreReordersAfterStateChange) {
    TestItem withUrl("url", "SHOULD");
    withUrl.targetUrl = "/landing";  // 60 + 20
    TestItem plain("plain", "SHOULD");
    plain.newElements = 1;  // 60 + 15

    queue_.push(withUrl, state_);
    queue_.push(plain, state_);
    ASSERT_EQ(queue_.peek()->id, "url");

    state_.markUrlVisited("/landing");
    queue_.rescoreAll(state_);

    EXPECT_EQ(queue_.peek()->id, "plain");
    EXPECT_EQ(queue_.size(), 2u);
}

TEST_F(AdaptivePriorityQueueTest, RescoreDropsCompletedItems) {
    queue_.push(TestItem("T1", "MUST"), state_);
    queue_.push(TestItem("T2", "MUST"), state_);
    queue_.push(TestItem("T3", "MAY"), state_);

    state_.markTestCompleted("T2");
    size_t before = queue_.size();
    queue_.rescoreAll(state_);

    EXPECT_LE(queue_.size(), before);
    EXPECT_EQ(queue_.size(), 2u);
    EXPECT_FALSE(queue_.contains("T2"));
    EXPECT_TRUE(queue_.contains("T1"));
}

TEST_F(AdaptivePriorityQueueTest, RescorePreservesFifoAmongTies) {
    for (const char *id : {"A", "B", "C"}) {
        queue_.push(TestItem(id, "MAY"), state_);
    }
    state_.markDomSeen("sig");
    queue_.rescoreAll(state_);
    EXPECT_EQ(drain(), (std::vector<std::string>{"A", "B", "C"}));
}

TEST_F(AdaptivePriorityQueueTest, ContainsAndRemove) {
    queue_.push(TestItem("T1", "MUST"), state_);
    queue_.push(TestItem("T2", "MAY"), state_);

    EXPECT_TRUE(queue_.contains("T1"));
    EXPECT_TRUE(queue_.remove("T1"));
    EXPECT_FALSE(queue_.contains("T1"));
    EXPECT_FALSE(queue_.remove("T1"));
    EXPECT_EQ(queue_.size(), 1u);
    EXPECT_EQ(queue_.peek()->id, "T2");
}

TEST_F(AdaptivePriorityQueueTest, DuplicateIdsAreTrackedPerEntry) {
    queue_.push(TestItem("T1", "MUST"), state_);
    queue_.push(TestItem("T1", "MUST"), state_);
    EXPECT_EQ(queue_.size(), 2u);

    queue_.pop();
    EXPECT_TRUE(queue_.contains("T1"));
    queue_.pop();
    EXPECT_FALSE(queue_.contains("T1"));
}

TEST_F(AdaptivePriorityQueueTest, ClearEmptiesQueue) {
    queue_.push(TestItem("T1", "MUST"), state_);
    queue_.clear();
    EXPECT_TRUE(queue_.empty());
    EXPECT_FALSE(queue_.contains("T1"));
}

}  // namespace Test
}  // namespace GAIA
