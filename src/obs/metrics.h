#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "../metrics.h"
#include "obs/logging.h"

namespace logrca::obs {

namespace detail {
inline auto MetricPayload(const std::string& name,
                          const nlohmann::json& value,
                          const std::string& unit,
                          const metrics::Labels& labels,
                          nlohmann::json fields) -> nlohmann::json {
    fields["metric_name"] = name;
    fields["value"] = value;
    fields["unit"] = unit;
    if (!labels.empty()) {
        fields["labels"] = labels;
    }
    return fields;
}
} // namespace detail

// Adds to the registry counter and logs the increment at debug level.
inline void EmitCounter(const std::string& name,
                        long value,
                        const std::string& unit,
                        const std::string& component,
                        const metrics::Labels& labels = {},
                        const nlohmann::json& fields = nlohmann::json::object()) {
    metrics::MetricsRegistry::Instance().Increment(name, labels, value);
    LogEvent(LogLevel::Debug, "metric", component, detail::MetricPayload(name, value, unit, labels, fields));
}

inline void EmitHistogram(const std::string& name,
                          double value,
                          const std::string& unit,
                          const std::string& component,
                          const metrics::Labels& labels = {},
                          const nlohmann::json& fields = nlohmann::json::object()) {
    metrics::MetricsRegistry::Instance().Observe(name, labels, value);
    LogEvent(LogLevel::Debug, "metric", component, detail::MetricPayload(name, value, unit, labels, fields));
}

} // namespace logrca::obs
