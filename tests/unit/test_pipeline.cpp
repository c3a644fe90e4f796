#include <gtest/gtest.h>
#include <string>

#include "errors.h"
#include "metrics.h"
#include "pipeline.h"
#include "../record_builders.h"

using namespace logrca;

namespace {

// One trace: an ERROR and a WARN on A with metrics, plus a startup INFO on B.
std::vector<LogEvent> IncidentLogs() {
    return {
        MakeEvent(10, Level::Error, "A", "T1", "Connection refused to db"),
        MakeEvent(10.1, Level::Warn, "A", "T1", "retrying"),
        MakeEvent(5, Level::Info, "B", "T1", "service ready"),
    };
}

std::vector<MetricSample> IncidentMetrics() {
    return {
        MakeSample(10, "A", MetricName::CpuUsage, 0.9),
        MakeSample(10, "A", MetricName::LatencyP95Ms, 50.0),
    };
}

} // namespace

TEST(PipelineTest, IncidentTraceIsAttributedToErroringService) {
    RcaConfig config;
    config.detection.contamination = 0.5;

    auto report = RunAnalysis(IncidentLogs(), IncidentMetrics(), config);

    EXPECT_EQ(report.summary.anomaly_count, 1u);
    ASSERT_EQ(report.summary.top_errors.size(), 1u);
    EXPECT_EQ(report.summary.top_errors[0].message, "Connection refused to db");

    ASSERT_EQ(report.anomalies.size(), 1u);
    const auto& rca = report.anomalies[0];
    EXPECT_EQ(rca.trace_id, "T1");
    EXPECT_EQ(rca.root_cause_service, "A");
    EXPECT_EQ(rca.affected_services, (std::set<std::string>{"A", "B"}));
    EXPECT_DOUBLE_EQ(rca.metric_snapshot.at("cpu_usage"), 0.9);
    ASSERT_FALSE(rca.suggestions.empty());
    EXPECT_NE(rca.suggestions[0].find("High CPU usage"), std::string::npos);
}

TEST(PipelineTest, DefaultContaminationOnTinyBatchFlagsNothing) {
    auto report = RunAnalysis(IncidentLogs(), IncidentMetrics(), RcaConfig{});
    EXPECT_EQ(report.summary.anomaly_count, 0u);
    EXPECT_TRUE(report.anomalies.empty());
}

TEST(PipelineTest, EmptyLogsRaiseEmptyInputError) {
    EXPECT_THROW(RunAnalysis({}, IncidentMetrics(), RcaConfig{}), EmptyInputError);
}

TEST(PipelineTest, OnlyIgnoredLogsGiveEmptyReport) {
    std::vector<LogEvent> logs = {
        MakeEvent(1, Level::Info, "A", "T1", "Service ready"),
        MakeEvent(2, Level::Info, "B", "T2", "Application started in 4.1 seconds"),
    };
    auto report = RunAnalysis(logs, {}, RcaConfig{});
    EXPECT_EQ(report.summary.anomaly_count, 0u);
    EXPECT_TRUE(report.summary.top_errors.empty());
    EXPECT_TRUE(report.anomalies.empty());
}

TEST(PipelineTest, TrainingFailureFallsBackToAllNormal) {
    std::vector<LogEvent> logs = {MakeEvent(1, Level::Error, "A", "T1", "lonely failure")};
    auto report = RunAnalysis(logs, {}, RcaConfig{});
    EXPECT_EQ(report.summary.anomaly_count, 0u);
    EXPECT_TRUE(report.anomalies.empty());
}

TEST(PipelineTest, TrainingFailurePropagatesWithoutFallback) {
    RcaConfig config;
    config.fallback_on_training_error = false;
    std::vector<LogEvent> logs = {
        MakeEvent(1, Level::Error, "A", "T1", "same"),
        MakeEvent(1, Level::Error, "A", "T2", "same"),
    };
    EXPECT_THROW(RunAnalysis(logs, {}, config), ModelTrainingError);
}

TEST(PipelineTest, MalformedLogEventIsRejected) {
    std::vector<LogEvent> logs = {MakeEvent(1, Level::Error, "A", "", "no trace")};
    EXPECT_THROW(RunAnalysis(logs, {}, RcaConfig{}), MalformedRecordError);
}

TEST(PipelineTest, FailedStageTimersStopAtErrorLevel) {
    auto& registry = metrics::MetricsRegistry::Instance();
    auto failures = [&](const std::string& stage) {
        return registry.GetCounter("stage_failures_total", {{"stage", stage}});
    };
    long correlate_before = failures("stage_correlate");
    long run_before = failures("analysis_complete");
    long detect_before = failures("stage_detect");

    std::vector<LogEvent> logs = {MakeEvent(1, Level::Error, "A", "", "no trace")};
    EXPECT_THROW(RunAnalysis(logs, {}, RcaConfig{}), MalformedRecordError);
    EXPECT_EQ(failures("stage_correlate"), correlate_before + 1);
    EXPECT_EQ(failures("analysis_complete"), run_before + 1);
    EXPECT_EQ(failures("stage_detect"), detect_before);

    (void)RunAnalysis(IncidentLogs(), IncidentMetrics(), RcaConfig{});
    EXPECT_EQ(failures("stage_correlate"), correlate_before + 1);
    EXPECT_EQ(failures("analysis_complete"), run_before + 1);
}

TEST(PipelineTest, RunsAreCountedInRegistry) {
    auto& registry = metrics::MetricsRegistry::Instance();
    long before = registry.GetCounter("analysis_runs_total");
    (void)RunAnalysis(IncidentLogs(), IncidentMetrics(), RcaConfig{});
    EXPECT_EQ(registry.GetCounter("analysis_runs_total"), before + 1);
}
