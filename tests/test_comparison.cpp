#include <gtest/gtest.h>

#include <vector>

#include "comparison/comparison.hpp"

namespace {
const std::vector<int> kRequests = {82, 170, 43, 140, 24, 16, 190};
}

TEST(ComparisonTest, ProducesOneEntryPerPolicy) {
    ComparisonResult result = compareAll(kRequests, 50, 200);
    ASSERT_EQ(result.size(), ALL_POLICIES.size());

    EXPECT_EQ(result.at(Policy::FCFS).schedule.seekCost, 642);
    EXPECT_EQ(result.at(Policy::SSTF).schedule.seekCost, 208);
    EXPECT_EQ(result.at(Policy::SCAN).schedule.seekCost, 332);
    EXPECT_EQ(result.at(Policy::C_SCAN).schedule.seekCost, 391);

    for (const auto &[policy, outcome] : result) {
        ASSERT_TRUE(outcome.ok()) << policyName(policy);
        EXPECT_TRUE(outcome.error.empty());
        EXPECT_EQ(outcome.metrics->totalSeek, outcome.schedule.seekCost);
        EXPECT_DOUBLE_EQ(outcome.metrics->averageSeek, outcome.schedule.seekCost / 7.0);
    }
}

TEST(ComparisonTest, MatchesSinglePolicyRuns) {
    ComparisonResult result = compareAll(kRequests, 50, 200);
    for (Policy policy : ALL_POLICIES) {
        ScheduleResult single = schedule(policy, kRequests, 50, 200);
        EXPECT_EQ(result.at(policy).schedule.order, single.order) << policyName(policy);
    }
}

TEST(ComparisonTest, ParallelAndSequentialAgree) {
    for (int round = 0; round < 20; ++round) {
        ComparisonResult parallel = compareAll(kRequests, 50, 200, true);
        ComparisonResult sequential = compareAll(kRequests, 50, 200, false);
        for (Policy policy : ALL_POLICIES) {
            EXPECT_EQ(parallel.at(policy).schedule.order, sequential.at(policy).schedule.order);
            EXPECT_EQ(parallel.at(policy).schedule.seekCost, sequential.at(policy).schedule.seekCost);
        }
    }
}

TEST(ComparisonTest, EmptyInputFailsPerEntryWithoutAborting) {
    ComparisonResult result = compareAll({}, 50, 200);
    ASSERT_EQ(result.size(), ALL_POLICIES.size());
    for (const auto &[policy, outcome] : result) {
        EXPECT_FALSE(outcome.ok()) << policyName(policy);
        EXPECT_FALSE(outcome.error.empty());
        EXPECT_EQ(outcome.schedule.order, std::vector<int>{50});
        EXPECT_EQ(outcome.schedule.seekCost, 0);
    }
}

TEST(ComparisonTest, ZeroCostPolicyIsNotAFailure) {
    // Só FCFS e SSTF ficam parados; SCAN e C-SCAN ainda vão até a fronteira
    ComparisonResult result = compareAll({50, 50}, 50, 200);
    EXPECT_TRUE(result.at(Policy::FCFS).ok());
    EXPECT_DOUBLE_EQ(result.at(Policy::FCFS).metrics->throughput, 0.0);
    EXPECT_DOUBLE_EQ(result.at(Policy::SSTF).metrics->throughput, 0.0);
    EXPECT_GT(result.at(Policy::SCAN).metrics->throughput, 0.0);
    EXPECT_GT(result.at(Policy::C_SCAN).metrics->throughput, 0.0);
}

TEST(ComparisonTest, SharedInputIsNotModified) {
    const std::vector<int> original = kRequests;
    std::vector<int> requests = kRequests;
    compareAll(requests, 50, 200, true);
    EXPECT_EQ(requests, original);
}

TEST(ComparisonTest, RunPolicyReportsEmptyInput) {
    PolicyOutcome outcome = runPolicy(Policy::SCAN, {}, 10, 100);
    EXPECT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.schedule.order, std::vector<int>{10});
}
