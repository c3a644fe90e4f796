#include "correlation/time_correlator.h"

#include <algorithm>
#include <array>
#include <iterator>
#include <utility>

#include <spdlog/spdlog.h>

#include "errors.h"
#include "obs/logging.h"
#include "obs/metrics.h"

namespace logrca::correlation {

namespace {

struct PivotCell {
    std::array<double, kMetricCount> sum{};
    std::array<int, kMetricCount> count{};
};

auto AbsDiff(Timestamp a, Timestamp b) -> Timestamp::duration {
    return a > b ? a - b : b - a;
}

} // namespace

auto PivotMetrics(const std::vector<MetricSample>& samples) -> MetricIndex {
    std::map<std::pair<std::string, Timestamp>, PivotCell> cells;
    for (const auto& s : samples) {
        if (s.service.empty()) {
            throw MalformedRecordError("metric sample without service");
        }
        auto& cell = cells[{s.service, s.timestamp}];
        auto idx = static_cast<size_t>(s.metric);
        cell.sum[idx] += s.value;
        cell.count[idx] += 1;
    }

    // Key order is (service, timestamp), so each service's rows come out sorted.
    MetricIndex index;
    for (const auto& kv : cells) {
        WideMetricRecord rec;
        rec.service = kv.first.first;
        rec.timestamp = kv.first.second;
        for (size_t i = 0; i < kMetricCount; ++i) {
            if (kv.second.count[i] > 0) {
                rec.metrics.values[i] = kv.second.sum[i] / kv.second.count[i];
            }
        }
        index[rec.service].push_back(std::move(rec));
    }
    return index;
}

auto TimeCorrelator::FindNearest(const MetricIndex& index,
                                 const std::string& service,
                                 Timestamp ts) const -> const WideMetricRecord* {
    auto it = index.find(service);
    if (it == index.end() || it->second.empty()) {
        return nullptr;
    }
    const auto& rows = it->second;
    auto upper = std::lower_bound(rows.begin(), rows.end(), ts,
                                  [](const WideMetricRecord& r, Timestamp t) { return r.timestamp < t; });

    const WideMetricRecord* best = nullptr;
    if (upper != rows.begin()) {
        best = &*std::prev(upper);
    }
    // On equal distance the earlier sample is kept.
    if (upper != rows.end()) {
        if (best == nullptr || AbsDiff(upper->timestamp, ts) < AbsDiff(best->timestamp, ts)) {
            best = &*upper;
        }
    }
    if (best == nullptr || AbsDiff(best->timestamp, ts) > tolerance_) {
        return nullptr;
    }
    return best;
}

auto TimeCorrelator::Correlate(const std::vector<LogEvent>& logs,
                               const std::vector<MetricSample>& samples) const -> std::vector<EnrichedRecord> {
    if (samples.empty()) {
        obs::LogEvent(obs::LogLevel::Warn, "metrics_empty", "correlator",
                      {{"log_events", logs.size()}});
    }
    return Correlate(logs, PivotMetrics(samples));
}

auto TimeCorrelator::Correlate(const std::vector<LogEvent>& logs,
                               const MetricIndex& index) const -> std::vector<EnrichedRecord> {
    std::vector<EnrichedRecord> out;
    out.reserve(logs.size());
    size_t matched = 0;

    for (size_t i = 0; i < logs.size(); ++i) {
        const auto& ev = logs[i];
        if (ev.service.empty() || ev.trace_id.empty()) {
            obs::LogEvent(obs::LogLevel::Error, "malformed_record", "correlator",
                          {{"index", i}, {"error_code", obs::kErrMalformedRecord}});
            throw MalformedRecordError("log event " + std::to_string(i) + " is missing " +
                                       (ev.service.empty() ? "service" : "trace_id"));
        }

        EnrichedRecord rec;
        rec.event = ev;
        if (const auto* nearest = FindNearest(index, ev.service, ev.timestamp)) {
            rec.metrics = nearest->metrics;
            rec.metrics_matched = true;
            ++matched;
        }
        out.push_back(std::move(rec));
    }

    spdlog::debug("Correlated {} log events, {} matched a metric snapshot within {} ms",
                  logs.size(), matched, tolerance_.count());
    obs::EmitCounter("correlator_matched_total", static_cast<long>(matched), "records", "correlator");
    obs::EmitCounter("correlator_unmatched_total", static_cast<long>(logs.size() - matched), "records", "correlator");
    return out;
}

} // namespace logrca::correlation
