#pragma once

#include <algorithm>
#include <limits>
#include <map>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace logrca::metrics {

using Labels = std::map<std::string, std::string>;

struct HistogramStats {
    long count = 0;
    double sum = 0.0;
    double min = std::numeric_limits<double>::infinity();
    double max = -std::numeric_limits<double>::infinity();

    void Observe(double value) {
        ++count;
        sum += value;
        min = std::min(min, value);
        max = std::max(max, value);
    }

    [[nodiscard]] auto Mean() const -> double { return count == 0 ? 0.0 : sum / static_cast<double>(count); }
};

// Process-wide counters, gauges and duration histograms for analysis runs.
// Keys are "name" or "name{k="v",...}" with labels in key order.
class MetricsRegistry {
public:
    static MetricsRegistry& Instance() {
        static MetricsRegistry instance;
        return instance;
    }

    void Increment(const std::string& name, long value = 1) { Increment(name, {}, value); }

    void Increment(const std::string& name, const Labels& labels, long value = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[Key(name, labels)] += value;
    }

    void SetGauge(const std::string& name, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] = value;
    }

    void Observe(const std::string& name, const Labels& labels, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        histograms_[Key(name, labels)].Observe(value);
    }

    long GetCounter(const std::string& name, const Labels& labels = {}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find(Key(name, labels));
        return it == counters_.end() ? 0 : it->second;
    }

    HistogramStats GetHistogram(const std::string& name, const Labels& labels = {}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = histograms_.find(Key(name, labels));
        return it == histograms_.end() ? HistogramStats{} : it->second;
    }

    void Reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.clear();
        gauges_.clear();
        histograms_.clear();
    }

    std::string ToPrometheus() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string out;
        for (const auto& kv : counters_) {
            out += "# TYPE " + BaseName(kv.first) + " counter\n";
            out += kv.first + " " + std::to_string(kv.second) + "\n";
        }
        for (const auto& kv : gauges_) {
            out += "# TYPE " + kv.first + " gauge\n";
            out += kv.first + " " + std::to_string(kv.second) + "\n";
        }
        for (const auto& kv : histograms_) {
            out += "# TYPE " + BaseName(kv.first) + " summary\n";
            out += WithSuffix(kv.first, "_count") + " " + std::to_string(kv.second.count) + "\n";
            out += WithSuffix(kv.first, "_sum") + " " + std::to_string(kv.second.sum) + "\n";
        }
        return out;
    }

    // Snapshot for the end-of-run debug dump.
    nlohmann::json ToJson() const {
        std::lock_guard<std::mutex> lock(mutex_);
        nlohmann::json j;
        j["counters"] = counters_;
        j["gauges"] = gauges_;
        j["histograms"] = nlohmann::json::object();
        for (const auto& kv : histograms_) {
            j["histograms"][kv.first] = {{"count", kv.second.count},
                                         {"mean", kv.second.Mean()},
                                         {"min", kv.second.min},
                                         {"max", kv.second.max}};
        }
        return j;
    }

private:
    MetricsRegistry() = default;

    static std::string Key(const std::string& name, const Labels& labels) {
        if (labels.empty()) return name;
        std::string key = name + "{";
        for (auto it = labels.begin(); it != labels.end(); ++it) {
            if (it != labels.begin()) key += ",";
            key += it->first + "=\"" + it->second + "\"";
        }
        return key + "}";
    }

    static std::string BaseName(const std::string& key) { return key.substr(0, key.find('{')); }

    // foo{a="b"} + _sum -> foo_sum{a="b"}
    static std::string WithSuffix(const std::string& key, const std::string& suffix) {
        auto brace = key.find('{');
        if (brace == std::string::npos) return key + suffix;
        return key.substr(0, brace) + suffix + key.substr(brace);
    }

    mutable std::mutex mutex_;
    std::map<std::string, long> counters_;
    std::map<std::string, double> gauges_;
    std::map<std::string, HistogramStats> histograms_;
};

} // namespace logrca::metrics
