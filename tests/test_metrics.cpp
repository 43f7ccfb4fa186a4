#include <gtest/gtest.h>

#include "disk_scheduler/disk_scheduler.hpp"
#include "metrics/metrics.hpp"

TEST(MetricsTest, AverageAndThroughputFromScenario) {
    const std::vector<int> requests = {82, 170, 43, 140, 24, 16, 190};
    Metrics metrics = computeMetrics(fcfs(requests, 50, 200), requests.size());
    EXPECT_EQ(metrics.totalSeek, 642);
    EXPECT_DOUBLE_EQ(metrics.averageSeek, 642.0 / 7.0);
    EXPECT_DOUBLE_EQ(metrics.throughput, 7.0 / 642.0);
}

TEST(MetricsTest, ZeroCostRunHasZeroThroughput) {
    const std::vector<int> requests = {50, 50, 50};
    ScheduleResult result = sstf(requests, 50, 200);
    ASSERT_EQ(result.seekCost, 0);

    Metrics metrics;
    ASSERT_NO_THROW(metrics = computeMetrics(result, requests.size()));
    EXPECT_DOUBLE_EQ(metrics.throughput, 0.0);
    EXPECT_DOUBLE_EQ(metrics.averageSeek, 0.0);
}

TEST(MetricsTest, EmptyInputRaisesEmptyInputError) {
    EXPECT_THROW(averageSeekTime(0, 0), EmptyInputError);
    EXPECT_THROW(throughput(0, 0), EmptyInputError);
    EXPECT_THROW(computeMetrics(fcfs({}, 50, 200), 0), EmptyInputError);
}

TEST(MetricsTest, EmptyInputErrorIsADomainError) {
    try {
        throughput(10, 0);
        FAIL() << "esperava EmptyInputError";
    } catch (const std::domain_error &e) {
        EXPECT_NE(std::string(e.what()).find("nenhuma requisicao"), std::string::npos);
    }
}
