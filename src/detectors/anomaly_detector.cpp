#include "anomaly_detector.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <numeric>

#include <spdlog/spdlog.h>

#include "detectors/isolation_forest.h"
#include "errors.h"
#include "obs/metrics.h"

namespace logrca::anomaly {

namespace {

auto ToLower(std::string s) -> std::string {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

auto DetectionResult::AnomalyCount() const -> size_t {
    return static_cast<size_t>(std::count_if(scored.begin(), scored.end(),
                                             [](const ScoredRecord& s) { return s.result.is_anomaly; }));
}

auto AnomalyDetector::ShouldScore(const LogEvent& event) const -> bool {
    if (event.level == Level::Info) {
        return false;
    }
    auto msg = ToLower(event.message);
    for (const auto& phrase : detection_.ignore_messages) {
        if (msg.find(ToLower(phrase)) != std::string::npos) {
            return false;
        }
    }
    return true;
}

auto AnomalyDetector::FlagCount(size_t n) const -> size_t {
    auto k = std::llround(detection_.contamination * static_cast<double>(n));
    return std::min(n, static_cast<size_t>(std::max(0LL, k)));
}

auto AnomalyDetector::Filter(const std::vector<EnrichedRecord>& records,
                             const ServiceVocabulary& vocabulary) const -> DetectionResult {
    DetectionResult result;
    for (size_t i = 0; i < records.size(); ++i) {
        if (!ShouldScore(records[i].event)) {
            result.filtered_out++;
            continue;
        }
        ScoredRecord s;
        s.record_index = i;
        s.features = engineer_.Build(records[i], vocabulary);
        result.scored.push_back(s);
    }
    return result;
}

auto AnomalyDetector::AllNormal(const std::vector<EnrichedRecord>& records,
                                const ServiceVocabulary& vocabulary) const -> DetectionResult {
    return Filter(records, vocabulary);
}

auto AnomalyDetector::Detect(const std::vector<EnrichedRecord>& records,
                             const ServiceVocabulary& vocabulary) const -> DetectionResult {
    DetectionResult result = Filter(records, vocabulary);
    obs::EmitCounter("detector_filtered_total", static_cast<long>(result.filtered_out), "records", "detector");

    if (result.scored.empty()) {
        obs::LogEvent(obs::LogLevel::Info, "detector_nothing_to_score", "detector",
                      {{"records", records.size()}, {"filtered_out", result.filtered_out}});
        return result;
    }

    std::vector<FeatureVector> rows;
    rows.reserve(result.scored.size());
    for (const auto& s : result.scored) {
        rows.push_back(s.features);
    }

    StandardScaler scaler;
    scaler.Fit(rows);
    if (scaler.IsDegenerate()) {
        obs::LogEvent(obs::LogLevel::Error, "model_training_error", "detector",
                      {{"rows", rows.size()}, {"error_code", obs::kErrModelTrainingFailed}});
        throw ModelTrainingError("feature matrix is degenerate: all " + std::to_string(rows.size()) +
                                 " rows are identical");
    }
    auto matrix = scaler.Transform(rows);

    IsolationForest forest(forest_);
    forest.Fit(matrix);
    auto scores = forest.ScoreAll(matrix);

    // Highest scores first; equal scores keep input order.
    std::vector<size_t> order(scores.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&scores](size_t a, size_t b) { return scores[a] > scores[b]; });

    size_t k = FlagCount(scores.size());
    for (size_t i = 0; i < scores.size(); ++i) {
        result.scored[i].result.anomaly_score = scores[i];
    }
    for (size_t i = 0; i < k; ++i) {
        result.scored[order[i]].result.is_anomaly = true;
    }

    spdlog::info("Scored {} records ({} filtered), flagged {} at contamination {}",
                 scores.size(), result.filtered_out, k, detection_.contamination);
    obs::EmitCounter("detector_scored_total", static_cast<long>(scores.size()), "records", "detector");
    obs::EmitCounter("detector_anomalies_total", static_cast<long>(k), "records", "detector");
    return result;
}

} // namespace logrca::anomaly
