#include "types.h"

#include <algorithm>
#include <cctype>

namespace logrca {

auto ParseLevel(const std::string& text) -> Level {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") { return Level::Debug; }
    if (upper == "INFO") { return Level::Info; }
    if (upper == "WARN" || upper == "WARNING") { return Level::Warn; }
    if (upper == "ERROR") { return Level::Error; }
    if (upper == "CRITICAL") { return Level::Critical; }
    return Level::Unknown;
}

auto LevelToString(Level level) -> const char* {
    switch (level) {
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARN";
        case Level::Error:
            return "ERROR";
        case Level::Critical:
            return "CRITICAL";
        case Level::Unknown:
            break;
    }
    return "UNKNOWN";
}

auto AllMetricNames() -> const std::array<MetricName, kMetricCount>& {
    static const std::array<MetricName, kMetricCount> names = {
        MetricName::ErrorRate,
        MetricName::LatencyP95Ms,
        MetricName::CpuUsage,
        MetricName::JvmHeapUsedBytes,
        MetricName::JvmHeapMaxBytes,
        MetricName::HikaricpActive,
        MetricName::ThroughputRps
    };
    return names;
}

auto MetricNameToString(MetricName metric) -> const char* {
    switch (metric) {
        case MetricName::ErrorRate:
            return "error_rate";
        case MetricName::LatencyP95Ms:
            return "latency_p95_ms";
        case MetricName::CpuUsage:
            return "cpu_usage";
        case MetricName::JvmHeapUsedBytes:
            return "jvm_heap_used_bytes";
        case MetricName::JvmHeapMaxBytes:
            return "jvm_heap_max_bytes";
        case MetricName::HikaricpActive:
            return "hikaricp_active";
        case MetricName::ThroughputRps:
            return "throughput_requests_per_second";
    }
    return "unknown";
}

auto ParseMetricName(const std::string& name) -> std::optional<MetricName> {
    for (auto metric : AllMetricNames()) {
        if (name == MetricNameToString(metric)) {
            return metric;
        }
    }
    // Prometheus query name emitted by the collector
    if (name == "cpu_seconds_rate") {
        return MetricName::CpuUsage;
    }
    return std::nullopt;
}

auto MetricSnapshot::ToMap() const -> std::map<std::string, double> {
    std::map<std::string, double> out;
    for (auto metric : AllMetricNames()) {
        out[MetricNameToString(metric)] = Get(metric);
    }
    return out;
}

auto RcaRecord::operator==(const RcaRecord& other) const -> bool {
    return trace_id == other.trace_id &&
           root_cause_service == other.root_cause_service &&
           timestamp == other.timestamp &&
           message == other.message &&
           anomaly_score == other.anomaly_score &&
           metric_snapshot == other.metric_snapshot &&
           suggestions == other.suggestions &&
           affected_services == other.affected_services;
}

} // namespace logrca
