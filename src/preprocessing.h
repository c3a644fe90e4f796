#pragma once

#include <map>
#include <string>
#include <vector>

#include "contract.h"
#include "detector_config.h"
#include "linalg/matrix.h"

namespace logrca::anomaly {

// Categorical codes for service ids, built once per run and passed explicitly.
class ServiceVocabulary {
public:
    ServiceVocabulary() = default;

    // Distinct services in sorted order; code is the position.
    static auto Build(const std::vector<EnrichedRecord>& records) -> ServiceVocabulary;

    // -1 for services not seen at build time.
    [[nodiscard]] auto Encode(const std::string& service) const -> int;
    [[nodiscard]] auto Size() const -> size_t { return codes_.size(); }

    auto operator==(const ServiceVocabulary& other) const -> bool { return codes_ == other.codes_; }

private:
    std::map<std::string, int> codes_;
};

auto LevelScore(Level level) -> double;

class FeatureEngineer {
public:
    explicit FeatureEngineer(ThresholdConfig thresholds) : thresholds_(thresholds) {}

    // Pure: the same record and vocabulary always give the same vector.
    [[nodiscard]] auto Build(const EnrichedRecord& record, const ServiceVocabulary& vocabulary) const -> FeatureVector;

private:
    ThresholdConfig thresholds_;
};

// Column-wise z-score standardization, refit per batch.
class StandardScaler {
public:
    auto Fit(const std::vector<FeatureVector>& rows) -> void;
    [[nodiscard]] auto Transform(const std::vector<FeatureVector>& rows) const -> linalg::Matrix;

    [[nodiscard]] auto Mean() const -> const linalg::Vector& { return mean_; }
    [[nodiscard]] auto Scale() const -> const linalg::Vector& { return scale_; }

    // True when every column had zero variance at fit time.
    [[nodiscard]] auto IsDegenerate() const -> bool { return degenerate_; }

private:
    linalg::Vector mean_;
    linalg::Vector scale_;
    bool degenerate_ = true;
};

} // namespace logrca::anomaly
