#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "detector_config.h"
#include "detectors/anomaly_detector.h"
#include "types.h"

namespace logrca::report {

// anomaly_count and top_errors over flagged records; anomalies keep the
// aggregator's trace discovery order.
auto BuildReport(const std::vector<EnrichedRecord>& records,
                 const anomaly::DetectionResult& detection,
                 std::vector<RcaRecord> rca,
                 const ReportConfig& config) -> Report;

// Distinct messages by count, descending; ties keep first-seen order.
auto TopErrors(const std::vector<std::string>& messages, size_t limit) -> std::vector<TopError>;

auto ToJson(const RcaRecord& record) -> nlohmann::json;
auto ToJson(const Report& report) -> nlohmann::json;

// Throws std::runtime_error on missing fields or bad timestamps.
auto RcaRecordFromJson(const nlohmann::json& j) -> RcaRecord;
auto ReportFromJson(const nlohmann::json& j) -> Report;

void WriteReportJson(const Report& report, const std::string& output_path);
auto ReadReportJson(const std::string& path) -> Report;

} // namespace logrca::report
