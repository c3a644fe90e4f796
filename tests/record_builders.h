#pragma once

#include <chrono>
#include <string>

#include "types.h"

// Epoch-relative timestamps keep fixtures readable: At(10) is 10 s after 2025-01-01T00:00:00Z.
inline logrca::Timestamp At(double seconds) {
    auto base = std::chrono::system_clock::from_time_t(1735689600);
    return base + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                      std::chrono::duration<double>(seconds));
}

inline logrca::LogEvent MakeEvent(double seconds,
                                  logrca::Level level,
                                  const std::string& service,
                                  const std::string& trace_id,
                                  const std::string& message) {
    logrca::LogEvent e;
    e.timestamp = At(seconds);
    e.level = level;
    e.service = service;
    e.trace_id = trace_id;
    e.span_id = trace_id + "-span";
    e.class_name = "com.example.Handler";
    e.message = message;
    return e;
}

inline logrca::MetricSample MakeSample(double seconds,
                                       const std::string& service,
                                       logrca::MetricName metric,
                                       double value) {
    return logrca::MetricSample{At(seconds), service, metric, value};
}

inline logrca::EnrichedRecord MakeRecord(const logrca::LogEvent& event) {
    logrca::EnrichedRecord r;
    r.event = event;
    return r;
}
