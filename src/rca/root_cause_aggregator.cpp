#include "rca/root_cause_aggregator.h"

#include <map>
#include <set>
#include <string>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "obs/metrics.h"

namespace logrca::rca {

auto RootCauseAggregator::Aggregate(const std::vector<EnrichedRecord>& records,
                                    const anomaly::DetectionResult& detection) const -> std::vector<RcaRecord> {
    std::map<std::string, std::set<std::string>> services_by_trace;
    for (const auto& r : records) {
        services_by_trace[r.event.trace_id].insert(r.event.service);
    }

    // Best flagged record per trace, keyed into `detection.scored`.
    std::vector<std::string> trace_order;
    std::unordered_map<std::string, size_t> best;
    for (size_t i = 0; i < detection.scored.size(); ++i) {
        const auto& s = detection.scored[i];
        if (!s.result.is_anomaly) {
            continue;
        }
        const auto& ev = records.at(s.record_index).event;
        auto it = best.find(ev.trace_id);
        if (it == best.end()) {
            best.emplace(ev.trace_id, i);
            trace_order.push_back(ev.trace_id);
            continue;
        }
        const auto& current = detection.scored[it->second];
        const auto& current_ev = records.at(current.record_index).event;
        bool better = s.result.anomaly_score > current.result.anomaly_score ||
                      (s.result.anomaly_score == current.result.anomaly_score &&
                       ev.timestamp < current_ev.timestamp);
        if (better) {
            it->second = i;
        }
    }

    std::vector<RcaRecord> out;
    out.reserve(trace_order.size());
    for (const auto& trace_id : trace_order) {
        const auto& root = detection.scored[best.at(trace_id)];
        const auto& rec = records.at(root.record_index);

        RcaRecord rca;
        rca.trace_id = trace_id;
        rca.root_cause_service = rec.event.service;
        rca.timestamp = rec.event.timestamp;
        rca.message = rec.event.message;
        rca.anomaly_score = root.result.anomaly_score;
        rca.metric_snapshot = rec.metrics.ToMap();
        rca.suggestions = suggestions_.Suggest(rec.event.service, rec.event.message, root.features);
        rca.affected_services = services_by_trace[trace_id];
        out.push_back(std::move(rca));
    }

    spdlog::debug("Aggregated {} anomalous traces from {} records", out.size(), records.size());
    obs::EmitCounter("rca_traces_total", static_cast<long>(out.size()), "traces", "aggregator");
    return out;
}

} // namespace logrca::rca
