#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace logrca {

struct CorrelationConfig {
    std::chrono::milliseconds tolerance{15000}; // max |log ts - metric ts|
};

struct ForestConfig {
    int n_trees = 100;
    size_t max_samples = 256; // subsample per tree, capped at N
    uint64_t seed = 42;
    int n_threads = 1;
};

struct DetectionConfig {
    double contamination = 0.08;
    std::vector<std::string> ignore_messages = {
        "completed initialization",
        "application started",
        "service ready",
        "server started",
        "started successfully"
    };
};

// Alert thresholds used for exceedance features and suggestions.
struct ThresholdConfig {
    double latency_p95_ms = 1000.0;
    double cpu_usage = 0.85;
    double error_rate = 0.10;
    double jvm_heap_usage_ratio = 0.85;
    double hikaricp_active = 9.0;
};

struct ReportConfig {
    size_t top_errors_limit = 10;
};

struct RcaConfig {
    CorrelationConfig correlation;
    ForestConfig forest;
    DetectionConfig detection;
    ThresholdConfig thresholds;
    ReportConfig report;

    // On ModelTrainingError: report every record as normal instead of failing.
    bool fallback_on_training_error = true;
};

struct ConfigValidationError {
    std::string field;
    std::string message;
};

auto ValidateConfig(const RcaConfig& config) -> std::vector<ConfigValidationError>;

// Every key is optional; missing keys keep their defaults.
auto ConfigFromJson(const nlohmann::json& j) -> RcaConfig;
auto ConfigToJson(const RcaConfig& config) -> nlohmann::json;

auto LoadConfigFile(const std::string& path) -> RcaConfig;

} // namespace logrca
