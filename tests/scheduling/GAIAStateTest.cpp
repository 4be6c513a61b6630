#include "scheduling/GAIAState.h"
#include <gtest/gtest.h>

namespace GAIA {
namespace Test {

class GAIAStateTest : public ::testing::Test {
protected:
    GAIAState state_;
};

TEST_F(GAIAStateTest, FreshStateIsEmpty) {
    StateStats stats = state_.getStats();
    EXPECT_EQ(stats.visitedUrls, 0u);
    EXPECT_EQ(stats.visitedDoms, 0u);
    EXPECT_EQ(stats.failedTests, 0u);
    EXPECT_EQ(stats.completedTests, 0u);
    EXPECT_EQ(stats.executionRound, 0);
    EXPECT_FALSE(state_.getCurrentDomSignature().has_value());
}

TEST_F(GAIAStateTest, UrlTracking) {
    EXPECT_TRUE(state_.isUrlNew("https://shop.test/cart"));
    state_.markUrlVisited("https://shop.test/cart");
    EXPECT_FALSE(state_.isUrlNew("https://shop.test/cart"));
    EXPECT_TRUE(state_.isUrlNew("https://shop.test/checkout"));
}

TEST_F(GAIAStateTest, MarkDomSeenUpdatesCurrentSignature) {
    state_.markDomSeen("sig-a");
    state_.markDomSeen("sig-b");

    EXPECT_FALSE(state_.isDomNew("sig-a"));
    EXPECT_FALSE(state_.isDomNew("sig-b"));
    ASSERT_TRUE(state_.getCurrentDomSignature().has_value());
    EXPECT_EQ(*state_.getCurrentDomSignature(), "sig-b");

    // Revisiting a known page still moves the current signature
    state_.markDomSeen("sig-a");
    EXPECT_EQ(*state_.getCurrentDomSignature(), "sig-a");
    EXPECT_EQ(state_.getStats().visitedDoms, 2u);
}

TEST_F(GAIAStateTest, EmptyInputsAreIgnored) {
    state_.markUrlVisited("");
    state_.markDomSeen("");
    state_.markTestFailed("");
    state_.markTestCompleted("");

    StateStats stats = state_.getStats();
    EXPECT_EQ(stats.visitedUrls, 0u);
    EXPECT_EQ(stats.visitedDoms, 0u);
    EXPECT_EQ(stats.failedTests, 0u);
    EXPECT_EQ(stats.completedTests, 0u);
    EXPECT_FALSE(state_.getCurrentDomSignature().has_value());
}

TEST_F(GAIAStateTest, CompletionClearsFailure) {
    state_.markTestFailed("TC001");
    EXPECT_TRUE(state_.wasTestFailed("TC001"));

    state_.markTestCompleted("TC001");
    EXPECT_TRUE(state_.isTestCompleted("TC001"));
    EXPECT_FALSE(state_.wasTestFailed("TC001"));
}

TEST_F(GAIAStateTest, FailureAfterCompletionIsIgnored) {
    state_.markTestCompleted("TC001");
    state_.markTestFailed("TC001");

    EXPECT_TRUE(state_.isTestCompleted("TC001"));
    EXPECT_FALSE(state_.wasTestFailed("TC001"));
    EXPECT_TRUE(state_.getFailedTestIds().empty());
}

TEST_F(GAIAStateTest, ResetRestoresInitialState) {
    state_.markUrlVisited("/a");
    state_.markDomSeen("sig");
    state_.markTestFailed("T1");
    state_.markTestCompleted("T2");
    state_.incrementRound();
    state_.incrementRound();
    EXPECT_EQ(state_.getExecutionRound(), 2);

    state_.reset();

    EXPECT_TRUE(state_.getVisitedUrls().empty());
    EXPECT_TRUE(state_.getVisitedDomSignatures().empty());
    EXPECT_TRUE(state_.getFailedTestIds().empty());
    EXPECT_TRUE(state_.getCompletedTestIds().empty());
    EXPECT_FALSE(state_.getCurrentDomSignature().has_value());
    EXPECT_EQ(state_.getExecutionRound(), 0);
}

TEST_F(GAIAStateTest, StatsToJson) {
    state_.markUrlVisited("/a");
    state_.markTestCompleted("T1");
    state_.incrementRound();

    json stats = state_.getStats().toJson();
    EXPECT_EQ(stats["visited_urls_count"], 1);
    EXPECT_EQ(stats["visited_dom_count"], 0);
    EXPECT_EQ(stats["failed_tests_count"], 0);
    EXPECT_EQ(stats["completed_tests_count"], 1);
    EXPECT_EQ(stats["execution_round"], 1);
}

}  // namespace Test
}  // namespace GAIA
