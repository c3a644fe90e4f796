#pragma once

#include <vector>

#include "detector_config.h"
#include "types.h"

namespace logrca {

// Runs correlate -> features -> isolation forest -> trace aggregation -> report
// over one bounded window. Throws EmptyInputError when `logs` is empty and
// MalformedRecordError for records without identity fields. A
// ModelTrainingError propagates only when fallback_on_training_error is off.
auto RunAnalysis(const std::vector<LogEvent>& logs,
                 const std::vector<MetricSample>& samples,
                 const RcaConfig& config) -> Report;

} // namespace logrca
