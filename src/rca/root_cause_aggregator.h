#pragma once

#include <utility>
#include <vector>

#include "detectors/anomaly_detector.h"
#include "rca/suggestion_engine.h"
#include "types.h"

namespace logrca::rca {

class RootCauseAggregator {
public:
    explicit RootCauseAggregator(SuggestionEngine suggestions) : suggestions_(std::move(suggestions)) {}

    // One RcaRecord per trace with at least one flagged record, in the order
    // each trace's first flagged record appears. Blast radius is taken from
    // every record of the trace, including those never scored.
    [[nodiscard]] auto Aggregate(const std::vector<EnrichedRecord>& records,
                                 const anomaly::DetectionResult& detection) const -> std::vector<RcaRecord>;

private:
    SuggestionEngine suggestions_;
};

} // namespace logrca::rca
