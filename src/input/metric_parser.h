#pragma once

#include <string>
#include <vector>

#include "types.h"

namespace logrca::input {

// Per-service metric dump:
//   # SERVICE=checkout
//   ## METRIC: latency_p95_ms
//   ## PROMQL: histogram_quantile(... service="checkout" ...)
//   2025-01-01T10:00:00+00:00<TAB>123.4
// The PROMQL service label, when present, overrides the SERVICE header.
auto ParseMetricLines(const std::vector<std::string>& lines) -> std::vector<MetricSample>;

// `path` may be a file or a directory; directory entries are read in name order.
// Throws std::runtime_error if the path cannot be read.
auto ParseMetricPath(const std::string& path) -> std::vector<MetricSample>;

} // namespace logrca::input
