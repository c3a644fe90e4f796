#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

#include "types.h"

namespace logrca::correlation {

using MetricIndex = std::map<std::string, std::vector<WideMetricRecord>>;

// Pivots samples into one wide record per (service, timestamp), sorted by
// timestamp within each service. Repeated samples of one metric are averaged.
auto PivotMetrics(const std::vector<MetricSample>& samples) -> MetricIndex;

class TimeCorrelator {
public:
    explicit TimeCorrelator(std::chrono::milliseconds tolerance = std::chrono::seconds(15))
        : tolerance_(tolerance) {}

    // One EnrichedRecord per log event, in input order. Throws
    // MalformedRecordError for events without service or trace_id.
    [[nodiscard]] auto Correlate(const std::vector<LogEvent>& logs,
                                 const std::vector<MetricSample>& samples) const -> std::vector<EnrichedRecord>;

    [[nodiscard]] auto Correlate(const std::vector<LogEvent>& logs,
                                 const MetricIndex& index) const -> std::vector<EnrichedRecord>;

    // Nearest record of the event's service within tolerance, or nullptr.
    [[nodiscard]] auto FindNearest(const MetricIndex& index,
                                   const std::string& service,
                                   Timestamp ts) const -> const WideMetricRecord*;

private:
    std::chrono::milliseconds tolerance_;
};

} // namespace logrca::correlation
