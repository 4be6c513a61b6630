#include "model/ExecutionResult.h"
#include "scheduling/PriorityLogger.h"
#include <filesystem>
#include <gtest/gtest.h>
#include <string>

namespace GAIA {
namespace Test {

class PriorityLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() /
                   (std::string("gaia_priority_logger_") +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(tempDir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
    }

    std::filesystem::path tempDir_;
    GAIAState state_;
};

TEST_F(PriorityLoggerTest, DefaultLogFile) {
    PriorityLogger logger;
    EXPECT_EQ(logger.logFile(), "priority_log.json");
    EXPECT_EQ(logger.size(), 0u);
}

TEST_F(PriorityLoggerTest, ScoreEntryCarriesBreakdown) {
    PriorityLogger logger;
    TestItem item("C1", "MUST");
    item.newElements = 2;
    item.targetUrl = "https://c1.com";
    state_.incrementRound();

    logger.logScore(item, state_, LogAction::INGESTED);

    ASSERT_EQ(logger.size(), 1u);
    json entry = logger.toJson()[0];
    EXPECT_EQ(entry["id"], "C1");
    EXPECT_EQ(entry["action"], "ingested");
    EXPECT_EQ(entry["priority"], "MUST");
    EXPECT_EQ(entry["score"], 150);
    EXPECT_EQ(entry["base_score"], 100);
    EXPECT_EQ(entry["dom_bonus"], 30);
    EXPECT_EQ(entry["url_bonus"], 20);
    EXPECT_EQ(entry["fail_bonus"], 0);
    EXPECT_EQ(entry["no_change_penalty"], 0);
    EXPECT_EQ(entry["new_elements_count"], 2);
    EXPECT_EQ(entry["execution_round"], 1);
    EXPECT_TRUE(entry["timestamp"].is_string());
    EXPECT_FALSE(entry.contains("result"));
}

TEST_F(PriorityLoggerTest, ScoreIsRecomputedAtLogTime) {
    PriorityLogger logger;
    TestItem item("T1", "SHOULD");
    item.targetUrl = "/cart";

    logger.logScore(item, state_);
    state_.markUrlVisited("/cart");
    logger.logScore(item, state_);

    json entries = logger.toJson();
    EXPECT_EQ(entries[0]["action"], "scored");
    EXPECT_EQ(entries[0]["score"], 80);
    EXPECT_EQ(entries[1]["score"], 60);
}

TEST_F(PriorityLoggerTest, ExecutionEntryIncludesResultAndDetails) {
    PriorityLogger logger;
    TestItem item("T1", "MUST");
    state_.markTestFailed("T1");

    auto result = ExecutionResult::failure("selector not found");
    logger.logExecution(item, state_, ExecutionStatus::FAILED, result.toJson());

    json entry = logger.toJson()[0];
    EXPECT_EQ(entry["action"], "executed");
    EXPECT_EQ(entry["result"], "failed");
    EXPECT_EQ(entry["fail_bonus"], 10);
    ASSERT_TRUE(entry.contains("details"));
    EXPECT_EQ(entry["details"]["error"], "selector not found");
}

TEST_F(PriorityLoggerTest, ExecutionEntryWithoutDetailsOmitsKey) {
    PriorityLogger logger;
    logger.logExecution(TestItem("T1", "MAY"), state_, ExecutionStatus::SUCCESS);
    logger.logExecution(TestItem("T2", "MAY"), state_, ExecutionStatus::SUCCESS, json::object());

    json entries = logger.toJson();
    EXPECT_FALSE(entries[0].contains("details"));
    EXPECT_FALSE(entries[1].contains("details"));
}

TEST_F(PriorityLoggerTest, RescoreEntryCarriesReasonAndStateSummary) {
    PriorityLogger logger;
    state_.markUrlVisited("/a");
    state_.markDomSeen("sig-1");
    state_.markTestCompleted("T1");

    logger.logRescore(state_, "dom_change");

    json entry = logger.toJson()[0];
    EXPECT_EQ(entry["action"], "rescore");
    EXPECT_EQ(entry["reason"], "dom_change");
    EXPECT_FALSE(entry.contains("id"));
    EXPECT_FALSE(entry.contains("score"));
    EXPECT_EQ(entry["state_summary"]["visited_urls"], 1);
    EXPECT_EQ(entry["state_summary"]["visited_doms"], 1);
    EXPECT_EQ(entry["state_summary"]["failed_tests"], 0);
    EXPECT_EQ(entry["state_summary"]["completed_tests"], 1);
}

TEST_F(PriorityLoggerTest, SummaryCountsAndAverages) {
    PriorityLogger logger;
    logger.logScore(TestItem("M1", "MUST"), state_);
    logger.logScore(TestItem("S1", "SHOULD"), state_);
    logger.logExecution(TestItem("M1", "MUST"), state_, ExecutionStatus::SUCCESS);

    state_.markTestFailed("S1");
    logger.logExecution(TestItem("S1", "SHOULD"), state_, ExecutionStatus::FAILED);
    logger.logExecution(TestItem("X1", "MAY"), state_, "skipped");
    logger.logRescore(state_, "dom_change");

    LogSummary summary = logger.getSummary();
    EXPECT_EQ(summary.totalEntries, 6u);
    EXPECT_EQ(summary.executedTests, 3u);
    EXPECT_EQ(summary.successCount, 1u);
    EXPECT_EQ(summary.failedCount, 1u);
    EXPECT_EQ(summary.rescoreEvents, 1u);

    ASSERT_EQ(summary.averageScoresByPriority.count("MUST"), 1u);
    EXPECT_DOUBLE_EQ(summary.averageScoresByPriority["MUST"], 100.0);
    EXPECT_DOUBLE_EQ(summary.averageScoresByPriority["SHOULD"], 65.0);
    EXPECT_DOUBLE_EQ(summary.averageScoresByPriority["MAY"], 30.0);

    json summaryJson = summary.toJson();
    EXPECT_EQ(summaryJson["total_entries"], 6);
    EXPECT_EQ(summaryJson["rescore_events"], 1);
    EXPECT_DOUBLE_EQ(summaryJson["average_scores_by_priority"]["SHOULD"].get<double>(), 65.0);
}

TEST_F(PriorityLoggerTest, SummaryIsRecomputable) {
    PriorityLogger logger;
    logger.logScore(TestItem("M1", "MUST"), state_);
    EXPECT_EQ(logger.getSummary().totalEntries, logger.getSummary().totalEntries);
    EXPECT_EQ(logger.size(), 1u);
}

TEST_F(PriorityLoggerTest, SaveWritesOrderedJsonArray) {
    std::string path = (tempDir_ / "logs" / "priority_log.json").string();
    PriorityLogger logger(path);
    logger.logScore(TestItem("T1", "MUST"), state_, LogAction::INGESTED);
    logger.logExecution(TestItem("T1", "MUST"), state_, ExecutionStatus::SUCCESS);
    logger.logRescore(state_, "dom_change");

    ASSERT_TRUE(logger.save());

    std::string error;
    auto saved = JsonUtils::loadFile(path, &error);
    ASSERT_TRUE(saved.has_value()) << error;
    ASSERT_TRUE(saved->is_array());
    ASSERT_EQ(saved->size(), 3u);
    EXPECT_EQ((*saved)[0]["action"], "ingested");
    EXPECT_EQ((*saved)[1]["action"], "executed");
    EXPECT_EQ((*saved)[2]["action"], "rescore");
}

TEST_F(PriorityLoggerTest, SaveToUnwritablePathReturnsFalse) {
    std::filesystem::create_directories(tempDir_);
    // A directory where the file should be
    std::filesystem::create_directories(tempDir_ / "occupied");

    PriorityLogger logger((tempDir_ / "occupied").string());
    logger.logRescore(state_, "dom_change");
    EXPECT_FALSE(logger.save());
}

TEST_F(PriorityLoggerTest, ClearDropsEntries) {
    PriorityLogger logger;
    logger.logScore(TestItem("T1", "MUST"), state_);
    logger.clear();
    EXPECT_EQ(logger.size(), 0u);
    EXPECT_EQ(logger.getSummary().totalEntries, 0u);
}

}  // namespace Test
}  // namespace GAIA
