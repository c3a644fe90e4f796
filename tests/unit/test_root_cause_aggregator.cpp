#include <gtest/gtest.h>

#include "rca/root_cause_aggregator.h"
#include "../record_builders.h"

using namespace logrca;
using namespace logrca::anomaly;
using logrca::rca::RootCauseAggregator;
using logrca::rca::SuggestionEngine;

namespace {

ScoredRecord Scored(size_t index, double score, bool flagged) {
    ScoredRecord s;
    s.record_index = index;
    s.result.anomaly_score = score;
    s.result.is_anomaly = flagged;
    return s;
}

} // namespace

class RootCauseAggregatorTest : public ::testing::Test {
protected:
    RootCauseAggregator aggregator{SuggestionEngine{ThresholdConfig{}}};
};

TEST_F(RootCauseAggregatorTest, PicksHighestScoringRecordPerTrace) {
    std::vector<EnrichedRecord> records = {
        MakeRecord(MakeEvent(1, Level::Warn, "gateway", "T1", "upstream slow")),
        MakeRecord(MakeEvent(2, Level::Error, "orders", "T1", "Connection refused")),
        MakeRecord(MakeEvent(3, Level::Info, "inventory", "T1", "lookup ok")),
    };
    records[1].metrics.Set(MetricName::CpuUsage, 0.4);

    DetectionResult detection;
    detection.scored = {Scored(0, 0.61, true), Scored(1, 0.74, true)};

    auto out = aggregator.Aggregate(records, detection);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].trace_id, "T1");
    EXPECT_EQ(out[0].root_cause_service, "orders");
    EXPECT_EQ(out[0].message, "Connection refused");
    EXPECT_DOUBLE_EQ(out[0].anomaly_score, 0.74);
    EXPECT_EQ(out[0].timestamp, At(2));
    EXPECT_EQ(out[0].affected_services, (std::set<std::string>{"gateway", "inventory", "orders"}));
    EXPECT_DOUBLE_EQ(out[0].metric_snapshot.at("cpu_usage"), 0.4);
    ASSERT_EQ(out[0].suggestions.size(), 1u);
    EXPECT_EQ(out[0].suggestions[0].rfind("orders: ", 0), 0u);
}

TEST_F(RootCauseAggregatorTest, TracesWithoutFlaggedRecordsAreOmitted) {
    std::vector<EnrichedRecord> records = {
        MakeRecord(MakeEvent(1, Level::Error, "A", "T1", "x")),
        MakeRecord(MakeEvent(2, Level::Error, "B", "T2", "y")),
    };
    DetectionResult detection;
    detection.scored = {Scored(0, 0.9, false), Scored(1, 0.7, true)};

    auto out = aggregator.Aggregate(records, detection);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].trace_id, "T2");
}

TEST_F(RootCauseAggregatorTest, TiesGoToEarlierTimestamp) {
    std::vector<EnrichedRecord> records = {
        MakeRecord(MakeEvent(9, Level::Error, "late", "T1", "x")),
        MakeRecord(MakeEvent(4, Level::Error, "early", "T1", "y")),
    };
    DetectionResult detection;
    detection.scored = {Scored(0, 0.8, true), Scored(1, 0.8, true)};

    auto out = aggregator.Aggregate(records, detection);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].root_cause_service, "early");
}

TEST_F(RootCauseAggregatorTest, TraceOrderFollowsFirstFlaggedRecord) {
    std::vector<EnrichedRecord> records = {
        MakeRecord(MakeEvent(1, Level::Error, "A", "T2", "x")),
        MakeRecord(MakeEvent(2, Level::Error, "B", "T1", "y")),
        MakeRecord(MakeEvent(3, Level::Error, "C", "T2", "z")),
    };
    DetectionResult detection;
    detection.scored = {Scored(0, 0.6, true), Scored(1, 0.9, true), Scored(2, 0.95, true)};

    auto out = aggregator.Aggregate(records, detection);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].trace_id, "T2");
    EXPECT_EQ(out[0].root_cause_service, "C");
    EXPECT_EQ(out[1].trace_id, "T1");
}

TEST_F(RootCauseAggregatorTest, EmptyDetectionGivesNoRecords) {
    std::vector<EnrichedRecord> records = {MakeRecord(MakeEvent(1, Level::Info, "A", "T1", "x"))};
    EXPECT_TRUE(aggregator.Aggregate(records, DetectionResult{}).empty());
}
