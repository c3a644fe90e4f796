#pragma once

#include <vector>
#include <string>
#include <array>
#include "types.h"

namespace logrca::anomaly {

// Fixed-size feature vector for one enriched log event.
// Order: lexical, categorical, raw metrics, derived ratio, exceedances, per-request ratios
struct FeatureVector {
    using ValueType = double;
    static constexpr size_t kSize = 19;

    std::array<ValueType, kSize> data{};

    auto message_len() -> ValueType& { return data[0]; }
    [[nodiscard]] auto message_len() const -> const ValueType& { return data[0]; }

    auto service_encoded() -> ValueType& { return data[1]; }
    [[nodiscard]] auto service_encoded() const -> const ValueType& { return data[1]; }

    auto level_score() -> ValueType& { return data[2]; }
    [[nodiscard]] auto level_score() const -> const ValueType& { return data[2]; }

    auto cpu_usage() -> ValueType& { return data[3]; }
    [[nodiscard]] auto cpu_usage() const -> const ValueType& { return data[3]; }

    auto error_rate() -> ValueType& { return data[4]; }
    [[nodiscard]] auto error_rate() const -> const ValueType& { return data[4]; }

    auto hikaricp_active() -> ValueType& { return data[5]; }
    [[nodiscard]] auto hikaricp_active() const -> const ValueType& { return data[5]; }

    auto jvm_heap_used_bytes() -> ValueType& { return data[6]; }
    [[nodiscard]] auto jvm_heap_used_bytes() const -> const ValueType& { return data[6]; }

    auto jvm_heap_max_bytes() -> ValueType& { return data[7]; }
    [[nodiscard]] auto jvm_heap_max_bytes() const -> const ValueType& { return data[7]; }

    auto latency_p95_ms() -> ValueType& { return data[8]; }
    [[nodiscard]] auto latency_p95_ms() const -> const ValueType& { return data[8]; }

    auto throughput_rps() -> ValueType& { return data[9]; }
    [[nodiscard]] auto throughput_rps() const -> const ValueType& { return data[9]; }

    auto jvm_heap_usage_ratio() -> ValueType& { return data[10]; }
    [[nodiscard]] auto jvm_heap_usage_ratio() const -> const ValueType& { return data[10]; }

    auto latency_exceedance() -> ValueType& { return data[11]; }
    [[nodiscard]] auto latency_exceedance() const -> const ValueType& { return data[11]; }

    auto cpu_exceedance() -> ValueType& { return data[12]; }
    [[nodiscard]] auto cpu_exceedance() const -> const ValueType& { return data[12]; }

    auto error_rate_exceedance() -> ValueType& { return data[13]; }
    [[nodiscard]] auto error_rate_exceedance() const -> const ValueType& { return data[13]; }

    auto heap_ratio_exceedance() -> ValueType& { return data[14]; }
    [[nodiscard]] auto heap_ratio_exceedance() const -> const ValueType& { return data[14]; }

    auto hikaricp_exceedance() -> ValueType& { return data[15]; }
    [[nodiscard]] auto hikaricp_exceedance() const -> const ValueType& { return data[15]; }

    auto cpu_per_request() -> ValueType& { return data[16]; }
    [[nodiscard]] auto cpu_per_request() const -> const ValueType& { return data[16]; }

    auto latency_per_request() -> ValueType& { return data[17]; }
    [[nodiscard]] auto latency_per_request() const -> const ValueType& { return data[17]; }

    auto heap_per_request() -> ValueType& { return data[18]; }
    [[nodiscard]] auto heap_per_request() const -> const ValueType& { return data[18]; }

    auto operator==(const FeatureVector& other) const -> bool { return data == other.data; }
};

struct FeatureMetadata {
    static auto GetFeatureNames() -> const std::vector<std::string>& {
        static const std::vector<std::string> names = {
            "message_len",
            "service_encoded",
            "level_score",
            "cpu_usage",
            "error_rate",
            "hikaricp_active",
            "jvm_heap_used_bytes",
            "jvm_heap_max_bytes",
            "latency_p95_ms",
            "throughput_requests_per_second",
            "jvm_heap_usage_ratio",
            "latency_p95_ms_exceedance",
            "cpu_usage_exceedance",
            "error_rate_exceedance",
            "jvm_heap_usage_ratio_exceedance",
            "hikaricp_active_exceedance",
            "cpu_per_request",
            "latency_per_request",
            "heap_per_request"
        };
        return names;
    }
};

} // namespace logrca::anomaly
