#pragma once

#include <string>
#include <utility>
#include <vector>

#include "../contract.h"
#include "../detector_config.h"
#include "../preprocessing.h"

namespace logrca::anomaly {

struct ScoredRecord {
    size_t record_index = 0; // into the enriched record list
    FeatureVector features;  // raw, before standardization
    AnomalyResult result;
};

struct DetectionResult {
    std::vector<ScoredRecord> scored; // input order
    size_t filtered_out = 0;

    [[nodiscard]] auto AnomalyCount() const -> size_t;
};

class AnomalyDetector {
public:
    AnomalyDetector(DetectionConfig detection, ForestConfig forest, ThresholdConfig thresholds)
        : detection_(std::move(detection)), forest_(forest), engineer_(thresholds) {}

    explicit AnomalyDetector(const RcaConfig& config)
        : AnomalyDetector(config.detection, config.forest, config.thresholds) {}

    // INFO events and ignore-listed startup messages are never scored.
    [[nodiscard]] auto ShouldScore(const LogEvent& event) const -> bool;

    // Throws ModelTrainingError when the kept rows carry no variance.
    [[nodiscard]] auto Detect(const std::vector<EnrichedRecord>& records,
                              const ServiceVocabulary& vocabulary) const -> DetectionResult;

    // Rows kept by ShouldScore, scored as normal. Used when training fails.
    [[nodiscard]] auto AllNormal(const std::vector<EnrichedRecord>& records,
                                 const ServiceVocabulary& vocabulary) const -> DetectionResult;

    // llround(contamination * n)
    [[nodiscard]] auto FlagCount(size_t n) const -> size_t;

private:
    auto Filter(const std::vector<EnrichedRecord>& records,
                const ServiceVocabulary& vocabulary) const -> DetectionResult;

    DetectionConfig detection_;
    ForestConfig forest_;
    FeatureEngineer engineer_;
};

} // namespace logrca::anomaly
