#pragma once

#include <chrono>
#include <exception>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "../metrics.h"
#include "time_resolution.h"

namespace logrca::obs {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

inline const char* LevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
    }
    return "INFO";
}

inline spdlog::level::level_enum ToSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return spdlog::level::debug;
        case LogLevel::Info:
            return spdlog::level::info;
        case LogLevel::Warn:
            return spdlog::level::warn;
        case LogLevel::Error:
            return spdlog::level::err;
    }
    return spdlog::level::info;
}

inline std::string NowIso8601() {
    return FormatIsoTime(std::chrono::system_clock::now());
}

// One JSON object per line: ts, level, event, component, then `fields`.
inline void LogEvent(LogLevel level,
                     const std::string& event,
                     const std::string& component,
                     const nlohmann::json& fields = nlohmann::json::object()) {
    auto spd_level = ToSpdlogLevel(level);
    if (!spdlog::should_log(spd_level)) {
        return;
    }
    nlohmann::json j = {
        {"ts", NowIso8601()},
        {"level", LevelToString(level)},
        {"event", event},
        {"component", component},
    };
    j.update(fields);
    spdlog::log(spd_level, j.dump());
}

// Times a pipeline stage. On Stop (or destruction) the duration is logged as
// `<event>` and observed in the `stage_duration_ms{stage=<event>}` histogram.
// A timer destroyed while an exception unwinds stops at Error level, and every
// Error stop counts toward `stage_failures_total{stage=<event>}`.
class ScopedTimer {
public:
    ScopedTimer(std::string event, std::string component, nlohmann::json fields = nlohmann::json::object())
        : event_(std::move(event)),
          component_(std::move(component)),
          fields_(std::move(fields)),
          start_(std::chrono::steady_clock::now()),
          exceptions_at_start_(std::uncaught_exceptions()) {}

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    ~ScopedTimer() {
        Stop(std::uncaught_exceptions() > exceptions_at_start_ ? LogLevel::Error : LogLevel::Info);
    }

    [[nodiscard]] auto ElapsedMs() const -> double {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_).count();
    }

    void Stop(LogLevel level = LogLevel::Info, const nlohmann::json& extra = nlohmann::json::object()) {
        if (stopped_) return;
        stopped_ = true;

        double elapsed = ElapsedMs();
        auto& registry = metrics::MetricsRegistry::Instance();
        registry.Observe("stage_duration_ms", {{"stage", event_}}, elapsed);
        if (level == LogLevel::Error) {
            registry.Increment("stage_failures_total", {{"stage", event_}});
        }

        nlohmann::json payload = fields_;
        payload.update(extra);
        payload["duration_ms"] = elapsed;
        LogEvent(level, event_, component_, payload);
    }

private:
    std::string event_;
    std::string component_;
    nlohmann::json fields_;
    std::chrono::steady_clock::time_point start_;
    int exceptions_at_start_;
    bool stopped_ = false;
};

} // namespace logrca::obs
