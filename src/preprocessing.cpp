#include "preprocessing.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

namespace logrca::anomaly {

namespace {

constexpr double kHeapEpsilon = 1e-9;
constexpr double kThroughputEpsilon = 1e-6;
// Columns whose spread is below this fraction of their magnitude are constant.
constexpr double kMinRelativeScale = 1e-9;

auto SafeDiv(double num, double den) -> double {
    double v = num / den;
    return std::isfinite(v) ? v : 0.0;
}

auto Exceedance(double value, double threshold) -> double {
    return std::max(0.0, value - threshold);
}

} // namespace

auto ServiceVocabulary::Build(const std::vector<EnrichedRecord>& records) -> ServiceVocabulary {
    std::set<std::string> services;
    for (const auto& r : records) {
        services.insert(r.event.service);
    }
    ServiceVocabulary vocab;
    int code = 0;
    for (const auto& s : services) {
        vocab.codes_[s] = code++;
    }
    return vocab;
}

auto ServiceVocabulary::Encode(const std::string& service) const -> int {
    auto it = codes_.find(service);
    return it == codes_.end() ? -1 : it->second;
}

auto LevelScore(Level level) -> double {
    switch (level) {
        case Level::Debug:
            return 1.0;
        case Level::Info:
            return 2.0;
        case Level::Warn:
            return 3.0;
        case Level::Error:
            return 4.0;
        case Level::Critical:
            return 5.0;
        case Level::Unknown:
            break;
    }
    return 0.0;
}

auto FeatureEngineer::Build(const EnrichedRecord& record, const ServiceVocabulary& vocabulary) const -> FeatureVector {
    const auto& m = record.metrics;
    FeatureVector v;

    v.message_len() = static_cast<double>(record.event.message.size());
    v.service_encoded() = static_cast<double>(vocabulary.Encode(record.event.service));
    v.level_score() = LevelScore(record.event.level);

    v.cpu_usage() = m.Get(MetricName::CpuUsage);
    v.error_rate() = m.Get(MetricName::ErrorRate);
    v.hikaricp_active() = m.Get(MetricName::HikaricpActive);
    v.jvm_heap_used_bytes() = m.Get(MetricName::JvmHeapUsedBytes);
    v.jvm_heap_max_bytes() = m.Get(MetricName::JvmHeapMaxBytes);
    v.latency_p95_ms() = m.Get(MetricName::LatencyP95Ms);
    v.throughput_rps() = m.Get(MetricName::ThroughputRps);

    v.jvm_heap_usage_ratio() = SafeDiv(v.jvm_heap_used_bytes(), v.jvm_heap_max_bytes() + kHeapEpsilon);

    v.latency_exceedance() = Exceedance(v.latency_p95_ms(), thresholds_.latency_p95_ms);
    v.cpu_exceedance() = Exceedance(v.cpu_usage(), thresholds_.cpu_usage);
    v.error_rate_exceedance() = Exceedance(v.error_rate(), thresholds_.error_rate);
    v.heap_ratio_exceedance() = Exceedance(v.jvm_heap_usage_ratio(), thresholds_.jvm_heap_usage_ratio);
    v.hikaricp_exceedance() = Exceedance(v.hikaricp_active(), thresholds_.hikaricp_active);

    double throughput = v.throughput_rps() + kThroughputEpsilon;
    v.cpu_per_request() = SafeDiv(v.cpu_usage(), throughput);
    v.latency_per_request() = SafeDiv(v.latency_p95_ms(), throughput);
    v.heap_per_request() = SafeDiv(v.jvm_heap_used_bytes(), throughput);

    return v;
}

auto StandardScaler::Fit(const std::vector<FeatureVector>& rows) -> void {
    if (rows.empty()) {
        throw std::invalid_argument("StandardScaler::Fit requires at least one row");
    }
    linalg::Matrix m(rows.size(), FeatureVector::kSize);
    for (size_t r = 0; r < rows.size(); ++r) {
        for (size_t c = 0; c < FeatureVector::kSize; ++c) {
            m(r, c) = rows[r].data[c];
        }
    }

    mean_ = linalg::column_means(m);
    scale_ = linalg::column_stddevs(m, mean_);
    degenerate_ = true;
    for (size_t c = 0; c < scale_.size(); ++c) {
        double& s = scale_[c];
        if (!std::isfinite(s) || s <= kMinRelativeScale * std::max(1.0, std::abs(mean_[c]))) {
            s = 1.0;
        } else {
            degenerate_ = false;
        }
    }
}

auto StandardScaler::Transform(const std::vector<FeatureVector>& rows) const -> linalg::Matrix {
    if (mean_.size() != FeatureVector::kSize) {
        throw std::logic_error("StandardScaler::Transform called before Fit");
    }
    linalg::Matrix out(rows.size(), FeatureVector::kSize);
    for (size_t r = 0; r < rows.size(); ++r) {
        for (size_t c = 0; c < FeatureVector::kSize; ++c) {
            out(r, c) = (rows[r].data[c] - mean_[c]) / scale_[c];
        }
    }
    return out;
}

} // namespace logrca::anomaly
