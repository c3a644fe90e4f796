#include "detector_config.h"

#include <fstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace logrca {

using json = nlohmann::json;

auto ValidateConfig(const RcaConfig& config) -> std::vector<ConfigValidationError> {
    std::vector<ConfigValidationError> errors;

    if (config.correlation.tolerance.count() < 0) {
        errors.push_back({"correlation.tolerance_seconds", "must be non-negative"});
    }
    if (config.forest.n_trees <= 0) {
        errors.push_back({"forest.n_trees", "must be positive"});
    }
    if (config.forest.max_samples < 2) {
        errors.push_back({"forest.max_samples", "must be at least 2"});
    }
    if (config.forest.n_threads <= 0) {
        errors.push_back({"forest.n_threads", "must be positive"});
    }
    if (!(config.detection.contamination > 0.0 && config.detection.contamination <= 0.5)) {
        errors.push_back({"detection.contamination", "must be in (0, 0.5]"});
    }
    for (const auto& phrase : config.detection.ignore_messages) {
        if (phrase.empty()) {
            errors.push_back({"detection.ignore_messages", "must not contain empty phrases"});
            break;
        }
    }

    const auto& t = config.thresholds;
    if (t.latency_p95_ms < 0.0 || t.cpu_usage < 0.0 || t.error_rate < 0.0 ||
        t.jvm_heap_usage_ratio < 0.0 || t.hikaricp_active < 0.0) {
        errors.push_back({"thresholds", "must be non-negative"});
    }
    if (config.report.top_errors_limit == 0) {
        errors.push_back({"report.top_errors_limit", "must be positive"});
    }
    return errors;
}

auto ConfigFromJson(const json& j) -> RcaConfig {
    RcaConfig config;

    if (j.contains("correlation")) {
        const auto& c = j.at("correlation");
        if (c.contains("tolerance_seconds")) {
            double secs = c.at("tolerance_seconds").get<double>();
            config.correlation.tolerance = std::chrono::milliseconds(static_cast<long long>(secs * 1000.0));
        }
    }

    if (j.contains("forest")) {
        const auto& f = j.at("forest");
        config.forest.n_trees = f.value("n_trees", config.forest.n_trees);
        config.forest.max_samples = f.value("max_samples", config.forest.max_samples);
        config.forest.seed = f.value("seed", config.forest.seed);
        config.forest.n_threads = f.value("n_threads", config.forest.n_threads);
    }

    if (j.contains("detection")) {
        const auto& d = j.at("detection");
        config.detection.contamination = d.value("contamination", config.detection.contamination);
        if (d.contains("ignore_messages")) {
            config.detection.ignore_messages = d.at("ignore_messages").get<std::vector<std::string>>();
        }
    }

    if (j.contains("thresholds")) {
        const auto& t = j.at("thresholds");
        config.thresholds.latency_p95_ms = t.value("latency_p95_ms", config.thresholds.latency_p95_ms);
        config.thresholds.cpu_usage = t.value("cpu_usage", config.thresholds.cpu_usage);
        config.thresholds.error_rate = t.value("error_rate", config.thresholds.error_rate);
        config.thresholds.jvm_heap_usage_ratio = t.value("jvm_heap_usage_ratio", config.thresholds.jvm_heap_usage_ratio);
        config.thresholds.hikaricp_active = t.value("hikaricp_active", config.thresholds.hikaricp_active);
    }

    if (j.contains("report")) {
        config.report.top_errors_limit = j.at("report").value("top_errors_limit", config.report.top_errors_limit);
    }

    config.fallback_on_training_error = j.value("fallback_on_training_error", config.fallback_on_training_error);
    return config;
}

auto ConfigToJson(const RcaConfig& config) -> json {
    json j;
    j["correlation"]["tolerance_seconds"] = static_cast<double>(config.correlation.tolerance.count()) / 1000.0;
    j["forest"]["n_trees"] = config.forest.n_trees;
    j["forest"]["max_samples"] = config.forest.max_samples;
    j["forest"]["seed"] = config.forest.seed;
    j["forest"]["n_threads"] = config.forest.n_threads;
    j["detection"]["contamination"] = config.detection.contamination;
    j["detection"]["ignore_messages"] = config.detection.ignore_messages;
    j["thresholds"]["latency_p95_ms"] = config.thresholds.latency_p95_ms;
    j["thresholds"]["cpu_usage"] = config.thresholds.cpu_usage;
    j["thresholds"]["error_rate"] = config.thresholds.error_rate;
    j["thresholds"]["jvm_heap_usage_ratio"] = config.thresholds.jvm_heap_usage_ratio;
    j["thresholds"]["hikaricp_active"] = config.thresholds.hikaricp_active;
    j["report"]["top_errors_limit"] = config.report.top_errors_limit;
    j["fallback_on_training_error"] = config.fallback_on_training_error;
    return j;
}

auto LoadConfigFile(const std::string& path) -> RcaConfig {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }
    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in config file " + path + ": " + e.what());
    }
    spdlog::info("Loaded config from {}", path);
    return ConfigFromJson(j);
}

} // namespace logrca
