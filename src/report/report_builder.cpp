#include "report/report_builder.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "obs/error_codes.h"
#include "obs/metrics.h"
#include "time_resolution.h"

namespace logrca::report {

using json = nlohmann::json;

auto TopErrors(const std::vector<std::string>& messages, size_t limit) -> std::vector<TopError> {
    std::vector<TopError> counts;
    std::unordered_map<std::string, size_t> position;
    for (const auto& m : messages) {
        auto it = position.find(m);
        if (it == position.end()) {
            position.emplace(m, counts.size());
            counts.push_back({m, 1});
        } else {
            counts[it->second].count++;
        }
    }
    std::stable_sort(counts.begin(), counts.end(),
                     [](const TopError& a, const TopError& b) { return a.count > b.count; });
    if (counts.size() > limit) {
        counts.resize(limit);
    }
    return counts;
}

auto BuildReport(const std::vector<EnrichedRecord>& records,
                 const anomaly::DetectionResult& detection,
                 std::vector<RcaRecord> rca,
                 const ReportConfig& config) -> Report {
    std::vector<std::string> messages;
    for (const auto& s : detection.scored) {
        if (s.result.is_anomaly) {
            messages.push_back(records.at(s.record_index).event.message);
        }
    }

    Report report;
    report.summary.anomaly_count = messages.size();
    report.summary.top_errors = TopErrors(messages, config.top_errors_limit);
    report.anomalies = std::move(rca);
    return report;
}

auto ToJson(const RcaRecord& record) -> json {
    json j;
    j["trace_id"] = record.trace_id;
    j["root_cause_service"] = record.root_cause_service;
    j["timestamp"] = FormatIsoTime(record.timestamp);
    j["message"] = record.message;
    j["anomaly_score"] = record.anomaly_score;
    j["metric_snapshot"] = record.metric_snapshot;
    j["suggestions"] = record.suggestions;
    j["affected_services"] = std::vector<std::string>(record.affected_services.begin(),
                                                      record.affected_services.end());
    return j;
}

auto ToJson(const Report& report) -> json {
    json top = json::array();
    for (const auto& e : report.summary.top_errors) {
        top.push_back(json{{"message", e.message}, {"count", e.count}});
    }
    json anomalies = json::array();
    for (const auto& r : report.anomalies) {
        anomalies.push_back(ToJson(r));
    }

    json j;
    j["summary"]["anomaly_count"] = report.summary.anomaly_count;
    j["summary"]["top_errors"] = top;
    j["anomalies"] = anomalies;
    return j;
}

auto RcaRecordFromJson(const json& j) -> RcaRecord {
    RcaRecord r;
    r.trace_id = j.at("trace_id").get<std::string>();
    r.root_cause_service = j.at("root_cause_service").get<std::string>();
    auto ts_text = j.at("timestamp").get<std::string>();
    auto ts = ParseIsoTime(ts_text);
    if (!ts.has_value()) {
        throw std::runtime_error("Invalid timestamp in report: " + ts_text);
    }
    r.timestamp = *ts;
    r.message = j.at("message").get<std::string>();
    r.anomaly_score = j.at("anomaly_score").get<double>();
    r.metric_snapshot = j.value("metric_snapshot", std::map<std::string, double>{});
    r.suggestions = j.value("suggestions", std::vector<std::string>{});
    auto services = j.value("affected_services", std::vector<std::string>{});
    r.affected_services.insert(services.begin(), services.end());
    return r;
}

auto ReportFromJson(const json& j) -> Report {
    Report report;
    try {
        const auto& summary = j.at("summary");
        report.summary.anomaly_count = summary.at("anomaly_count").get<size_t>();
        if (summary.contains("top_errors")) {
            for (const auto& e : summary.at("top_errors")) {
                report.summary.top_errors.push_back({e.at("message").get<std::string>(), e.at("count").get<size_t>()});
            }
        }
        for (const auto& a : j.at("anomalies")) {
            report.anomalies.push_back(RcaRecordFromJson(a));
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Malformed report document: ") + e.what());
    }
    return report;
}

void WriteReportJson(const Report& report, const std::string& output_path) {
    std::ofstream out(output_path);
    if (!out.is_open()) {
        obs::LogEvent(obs::LogLevel::Error, "report_write_error", "report",
                      {{"path", output_path}, {"error_code", obs::kErrReportWriteFailed}});
        throw std::runtime_error("Failed to open output path: " + output_path);
    }
    out << ToJson(report).dump(4);
    out.flush();
    out.close();

    std::error_code ec;
    auto size = std::filesystem::file_size(output_path, ec);
    if (!ec) {
        obs::EmitCounter("report_bytes_written", static_cast<long>(size), "bytes", "report",
                         {}, {{"report_path", output_path}});
    }
    spdlog::info("Report written to {} ({} anomalies)", output_path, report.summary.anomaly_count);
}

auto ReadReportJson(const std::string& path) -> Report {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open report: " + path);
    }
    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in report " + path + ": " + e.what());
    }
    return ReportFromJson(j);
}

} // namespace logrca::report
