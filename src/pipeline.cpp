#include "pipeline.h"

#include <utility>

#include <spdlog/spdlog.h>

#include "correlation/time_correlator.h"
#include "detectors/anomaly_detector.h"
#include "errors.h"
#include "obs/logging.h"
#include "obs/metrics.h"
#include "preprocessing.h"
#include "rca/root_cause_aggregator.h"
#include "rca/suggestion_engine.h"
#include "report/report_builder.h"

namespace logrca {

auto RunAnalysis(const std::vector<LogEvent>& logs,
                 const std::vector<MetricSample>& samples,
                 const RcaConfig& config) -> Report {
    obs::ScopedTimer run_timer("analysis_complete", "pipeline",
                               {{"log_events", logs.size()}, {"metric_samples", samples.size()}});

    if (logs.empty()) {
        obs::LogEvent(obs::LogLevel::Error, "analysis_error", "pipeline",
                      {{"error_code", obs::kErrEmptyInput}, {"error", "no log events"}});
        throw EmptyInputError("no log events to analyze");
    }

    std::vector<EnrichedRecord> records;
    {
        obs::ScopedTimer t("stage_correlate", "pipeline");
        correlation::TimeCorrelator correlator(config.correlation.tolerance);
        records = correlator.Correlate(logs, samples);
    }

    auto vocabulary = anomaly::ServiceVocabulary::Build(records);
    anomaly::AnomalyDetector detector(config);

    anomaly::DetectionResult detection;
    {
        obs::ScopedTimer t("stage_detect", "pipeline");
        try {
            detection = detector.Detect(records, vocabulary);
        } catch (const ModelTrainingError& e) {
            if (!config.fallback_on_training_error) {
                throw;
            }
            obs::LogEvent(obs::LogLevel::Warn, "model_training_fallback", "pipeline",
                          {{"error_code", e.code()}, {"error", e.what()}});
            detection = detector.AllNormal(records, vocabulary);
        }
    }

    std::vector<RcaRecord> root_causes;
    {
        obs::ScopedTimer t("stage_aggregate", "pipeline");
        rca::RootCauseAggregator aggregator{rca::SuggestionEngine(config.thresholds)};
        root_causes = aggregator.Aggregate(records, detection);
    }

    auto result = report::BuildReport(records, detection, std::move(root_causes), config.report);

    auto& registry = metrics::MetricsRegistry::Instance();
    registry.Increment("analysis_runs_total");
    registry.SetGauge("analysis_last_anomaly_count", static_cast<double>(result.summary.anomaly_count));
    run_timer.Stop(obs::LogLevel::Info, {{"anomaly_count", result.summary.anomaly_count},
                                         {"traces", result.anomalies.size()}});
    return result;
}

} // namespace logrca
