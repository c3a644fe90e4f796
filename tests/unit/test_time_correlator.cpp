#include <gtest/gtest.h>
#include <algorithm>

#include "correlation/time_correlator.h"
#include "errors.h"
#include "../record_builders.h"

using namespace logrca;
using logrca::correlation::PivotMetrics;
using logrca::correlation::TimeCorrelator;

TEST(TimeCorrelatorTest, MatchesNearestSampleWithinTolerance) {
    std::vector<LogEvent> logs = {MakeEvent(10, Level::Error, "A", "T1", "boom")};
    std::vector<MetricSample> samples = {
        MakeSample(0, "A", MetricName::CpuUsage, 0.1),
        MakeSample(12, "A", MetricName::CpuUsage, 0.9),
        MakeSample(30, "A", MetricName::CpuUsage, 0.5),
    };

    TimeCorrelator correlator;
    auto out = correlator.Correlate(logs, samples);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_TRUE(out[0].metrics_matched);
    EXPECT_DOUBLE_EQ(out[0].metrics.Get(MetricName::CpuUsage), 0.9);
}

TEST(TimeCorrelatorTest, ToleranceBoundIsInclusive) {
    std::vector<MetricSample> samples = {MakeSample(0, "A", MetricName::CpuUsage, 0.7)};
    TimeCorrelator correlator(std::chrono::seconds(15));

    auto at_bound = correlator.Correlate({MakeEvent(15, Level::Error, "A", "T1", "x")}, samples);
    EXPECT_TRUE(at_bound[0].metrics_matched);

    auto past_bound = correlator.Correlate({MakeEvent(15.5, Level::Error, "A", "T1", "x")}, samples);
    EXPECT_FALSE(past_bound[0].metrics_matched);
    EXPECT_DOUBLE_EQ(past_bound[0].metrics.Get(MetricName::CpuUsage), 0.0);
}

TEST(TimeCorrelatorTest, NeverMatchesAnotherService) {
    std::vector<MetricSample> samples = {MakeSample(10, "B", MetricName::CpuUsage, 0.99)};
    TimeCorrelator correlator;
    auto out = correlator.Correlate({MakeEvent(10, Level::Error, "A", "T1", "x")}, samples);
    EXPECT_FALSE(out[0].metrics_matched);
}

TEST(TimeCorrelatorTest, EqualDistanceKeepsEarlierSample) {
    std::vector<MetricSample> samples = {
        MakeSample(8, "A", MetricName::LatencyP95Ms, 100.0),
        MakeSample(12, "A", MetricName::LatencyP95Ms, 200.0),
    };
    TimeCorrelator correlator;
    auto out = correlator.Correlate({MakeEvent(10, Level::Error, "A", "T1", "x")}, samples);
    EXPECT_DOUBLE_EQ(out[0].metrics.Get(MetricName::LatencyP95Ms), 100.0);
}

TEST(TimeCorrelatorTest, ResultIsIndependentOfSampleOrder) {
    std::vector<LogEvent> logs = {
        MakeEvent(5, Level::Error, "A", "T1", "x"),
        MakeEvent(20, Level::Warn, "B", "T2", "y"),
    };
    std::vector<MetricSample> samples = {
        MakeSample(4, "A", MetricName::CpuUsage, 0.4),
        MakeSample(4, "A", MetricName::ErrorRate, 0.2),
        MakeSample(19, "B", MetricName::CpuUsage, 0.8),
        MakeSample(25, "B", MetricName::CpuUsage, 0.1),
    };
    auto shuffled = samples;
    std::reverse(shuffled.begin(), shuffled.end());

    TimeCorrelator correlator;
    auto a = correlator.Correlate(logs, samples);
    auto b = correlator.Correlate(logs, shuffled);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].metrics.values, b[i].metrics.values);
    }
    EXPECT_DOUBLE_EQ(a[0].metrics.Get(MetricName::ErrorRate), 0.2);
}

TEST(TimeCorrelatorTest, EmptyMetricsLeaveEveryRecordUnmatched) {
    std::vector<LogEvent> logs = {
        MakeEvent(1, Level::Error, "A", "T1", "x"),
        MakeEvent(2, Level::Info, "B", "T1", "y"),
    };
    TimeCorrelator correlator;
    auto out = correlator.Correlate(logs, std::vector<MetricSample>{});
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[1].event.service, "B");
    for (const auto& r : out) {
        EXPECT_FALSE(r.metrics_matched);
    }
}

TEST(TimeCorrelatorTest, PivotAveragesDuplicateSamples) {
    auto index = PivotMetrics({
        MakeSample(1, "A", MetricName::CpuUsage, 0.2),
        MakeSample(1, "A", MetricName::CpuUsage, 0.4),
        MakeSample(1, "A", MetricName::HikaricpActive, 3.0),
    });
    ASSERT_EQ(index.at("A").size(), 1u);
    EXPECT_DOUBLE_EQ(index.at("A")[0].metrics.Get(MetricName::CpuUsage), 0.3);
    EXPECT_DOUBLE_EQ(index.at("A")[0].metrics.Get(MetricName::HikaricpActive), 3.0);
}

TEST(TimeCorrelatorTest, RejectsRecordsWithoutIdentity) {
    TimeCorrelator correlator;
    EXPECT_THROW(correlator.Correlate({MakeEvent(1, Level::Error, "", "T1", "x")}, std::vector<MetricSample>{}),
                 MalformedRecordError);
    EXPECT_THROW(correlator.Correlate({MakeEvent(1, Level::Error, "A", "", "x")}, std::vector<MetricSample>{}),
                 MalformedRecordError);
    EXPECT_THROW(PivotMetrics({MakeSample(1, "", MetricName::CpuUsage, 0.1)}), MalformedRecordError);
}
