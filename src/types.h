#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace logrca {

using Timestamp = std::chrono::system_clock::time_point;

enum class Level {
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Unknown
};

auto ParseLevel(const std::string& text) -> Level;
auto LevelToString(Level level) -> const char*;

struct LogEvent {
    Timestamp timestamp;
    Level level = Level::Unknown;
    std::string service;
    std::string trace_id;
    std::string span_id;
    std::string class_name;
    std::string message; // continuation lines already merged
};

// Closed metric schema. Order is the index into MetricSnapshot.
enum class MetricName : size_t {
    ErrorRate = 0,
    LatencyP95Ms,
    CpuUsage,
    JvmHeapUsedBytes,
    JvmHeapMaxBytes,
    HikaricpActive,
    ThroughputRps
};

inline constexpr size_t kMetricCount = 7;

auto ParseMetricName(const std::string& name) -> std::optional<MetricName>;
auto MetricNameToString(MetricName metric) -> const char*;
auto AllMetricNames() -> const std::array<MetricName, kMetricCount>&;

struct MetricSample {
    Timestamp timestamp;
    std::string service;
    MetricName metric = MetricName::ErrorRate;
    double value = 0.0;
};

struct MetricSnapshot {
    std::array<double, kMetricCount> values{};

    auto Get(MetricName metric) const -> double { return values[static_cast<size_t>(metric)]; }
    auto Set(MetricName metric, double value) -> void { values[static_cast<size_t>(metric)] = value; }

    auto ToMap() const -> std::map<std::string, double>;
};

// Samples sharing (timestamp, service), pivoted into one row.
struct WideMetricRecord {
    Timestamp timestamp;
    std::string service;
    MetricSnapshot metrics;
};

struct EnrichedRecord {
    LogEvent event;
    MetricSnapshot metrics;
    bool metrics_matched = false;
};

struct AnomalyResult {
    double anomaly_score = 0.0;
    bool is_anomaly = false;
};

struct RcaRecord {
    std::string trace_id;
    std::string root_cause_service;
    Timestamp timestamp;
    std::string message;
    double anomaly_score = 0.0;
    std::map<std::string, double> metric_snapshot;
    std::vector<std::string> suggestions;
    std::set<std::string> affected_services;

    auto operator==(const RcaRecord& other) const -> bool;
};

struct TopError {
    std::string message;
    size_t count = 0;

    auto operator==(const TopError& other) const -> bool {
        return message == other.message && count == other.count;
    }
};

struct ReportSummary {
    size_t anomaly_count = 0;
    std::vector<TopError> top_errors;

    auto operator==(const ReportSummary& other) const -> bool {
        return anomaly_count == other.anomaly_count && top_errors == other.top_errors;
    }
};

struct Report {
    ReportSummary summary;
    std::vector<RcaRecord> anomalies;

    auto operator==(const Report& other) const -> bool {
        return summary == other.summary && anomalies == other.anomalies;
    }
};

} // namespace logrca
