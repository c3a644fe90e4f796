#pragma once

#include <functional>
#include <string>
#include <vector>

#include "contract.h"
#include "detector_config.h"

namespace logrca::rca {

// Immutable view of a root-cause record handed to every rule.
struct SuggestionContext {
    std::string service;
    std::string message;       // lowercased
    anomaly::FeatureVector features;
};

struct SuggestionRule {
    std::string name;
    std::function<bool(const SuggestionContext&)> matches;
    std::function<std::string(const SuggestionContext&)> render;
    bool skip_after_oom = false;
};

class SuggestionEngine {
public:
    explicit SuggestionEngine(ThresholdConfig thresholds);

    // Out-of-memory rule, then one entry per exceeded metric. If none of
    // those fire, exactly one keyword or generic fallback entry.
    [[nodiscard]] auto Suggest(const std::string& service,
                               const std::string& message,
                               const anomaly::FeatureVector& features) const -> std::vector<std::string>;

    [[nodiscard]] static auto IsOutOfMemory(const std::string& lowered_message) -> bool;

private:
    ThresholdConfig thresholds_;
    std::vector<SuggestionRule> oom_rules_;
    std::vector<SuggestionRule> metric_rules_;
    std::vector<SuggestionRule> keyword_rules_;
};

} // namespace logrca::rca
