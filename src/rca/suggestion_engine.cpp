#include "rca/suggestion_engine.h"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <utility>

#include <fmt/format.h>

namespace logrca::rca {

namespace {

auto ContainsAny(const std::string& text, std::initializer_list<const char*> needles) -> bool {
    return std::any_of(needles.begin(), needles.end(),
                       [&text](const char* n) { return text.find(n) != std::string::npos; });
}

auto KeywordRule(std::string name, std::initializer_list<const char*> keywords, std::string advice) -> SuggestionRule {
    std::vector<std::string> words(keywords.begin(), keywords.end());
    return SuggestionRule{
        std::move(name),
        [words](const SuggestionContext& ctx) {
            return std::any_of(words.begin(), words.end(),
                               [&ctx](const std::string& w) { return ctx.message.find(w) != std::string::npos; });
        },
        [advice](const SuggestionContext& ctx) { return fmt::format("{}: {}", ctx.service, advice); },
        false};
}

} // namespace

auto SuggestionEngine::IsOutOfMemory(const std::string& lowered_message) -> bool {
    return ContainsAny(lowered_message, {"outofmemory", "out of memory", "java heap space", "gc overhead limit"});
}

SuggestionEngine::SuggestionEngine(ThresholdConfig thresholds) : thresholds_(thresholds) {
    const double heap_limit = thresholds_.jvm_heap_usage_ratio;

    oom_rules_ = {
        {"oom_heap",
         [heap_limit](const SuggestionContext& ctx) {
             return IsOutOfMemory(ctx.message) && ctx.features.jvm_heap_usage_ratio() > heap_limit;
         },
         [](const SuggestionContext& ctx) {
             return fmt::format("{}: OutOfMemory with heap at {:.0f}% of max; check for a memory leak "
                                "(heap dump, retained objects) or raise -Xmx",
                                ctx.service, ctx.features.jvm_heap_usage_ratio() * 100.0);
         },
         false},
        {"oom_native",
         [heap_limit](const SuggestionContext& ctx) {
             return IsOutOfMemory(ctx.message) && ctx.features.jvm_heap_usage_ratio() <= heap_limit;
         },
         [](const SuggestionContext& ctx) {
             return fmt::format("{}: OutOfMemory while the JVM heap is not full; check container memory "
                                "limits, metaspace and native/direct buffer usage",
                                ctx.service);
         },
         false},
    };

    metric_rules_ = {
        {"latency",
         [](const SuggestionContext& ctx) { return ctx.features.latency_exceedance() > 0.0; },
         [t = thresholds_](const SuggestionContext& ctx) {
             return fmt::format("{}: High p95 latency ({:.0f} ms > {:.0f} ms); inspect slow dependencies, "
                                "timeouts and thread pool saturation",
                                ctx.service, ctx.features.latency_p95_ms(), t.latency_p95_ms);
         },
         false},
        {"cpu",
         [](const SuggestionContext& ctx) { return ctx.features.cpu_exceedance() > 0.0; },
         [t = thresholds_](const SuggestionContext& ctx) {
             return fmt::format("{}: High CPU usage ({:.2f} > {:.2f}); profile hot code paths or scale out",
                                ctx.service, ctx.features.cpu_usage(), t.cpu_usage);
         },
         false},
        {"heap",
         [](const SuggestionContext& ctx) { return ctx.features.heap_ratio_exceedance() > 0.0; },
         [t = thresholds_](const SuggestionContext& ctx) {
             return fmt::format("{}: JVM heap usage high ({:.0f}% > {:.0f}%); review GC activity and heap sizing",
                                ctx.service, ctx.features.jvm_heap_usage_ratio() * 100.0,
                                t.jvm_heap_usage_ratio * 100.0);
         },
         true},
        {"error_rate",
         [](const SuggestionContext& ctx) { return ctx.features.error_rate_exceedance() > 0.0; },
         [t = thresholds_](const SuggestionContext& ctx) {
             return fmt::format("{}: Elevated 5xx error rate ({:.2f}/s > {:.2f}/s); check recent deployments "
                                "and failing downstream calls",
                                ctx.service, ctx.features.error_rate(), t.error_rate);
         },
         false},
        {"connection_pool",
         [](const SuggestionContext& ctx) { return ctx.features.hikaricp_exceedance() > 0.0; },
         [t = thresholds_](const SuggestionContext& ctx) {
             return fmt::format("{}: DB connection pool near exhaustion ({:.0f} active > {:.0f}); look for "
                                "connection leaks, long transactions or increase the pool size",
                                ctx.service, ctx.features.hikaricp_active(), t.hikaricp_active);
         },
         false},
    };

    keyword_rules_ = {
        KeywordRule("timeout", {"timeout", "timed out"}, "Increase timeout or inspect slow dependencies"),
        KeywordRule("connection_refused", {"connection refused"},
                    "Target service refused the connection; verify it is up and reachable"),
        KeywordRule("customer_details", {"failed to retrieve customer details"},
                    "Check DB connection or downstream customer API"),
        KeywordRule("routing", {"nomapping", "page not found"}, "Verify controller endpoint or routing config"),
        KeywordRule("notification", {"emailbatch"}, "Check notification queue or mail server"),
        KeywordRule("transaction", {"jta", "transaction"}, "Review transaction boundaries or DB locks"),
        KeywordRule("connection", {"connection"}, "Investigate DB or network connection stability"),
        KeywordRule("exception", {"exception"}, "Check stack trace and root exception"),
        KeywordRule("database", {"database", "query"}, "Review DB performance or slow queries"),
    };
}

auto SuggestionEngine::Suggest(const std::string& service,
                               const std::string& message,
                               const anomaly::FeatureVector& features) const -> std::vector<std::string> {
    SuggestionContext ctx{service, message, features};
    std::transform(ctx.message.begin(), ctx.message.end(), ctx.message.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::vector<std::string> out;
    bool oom = false;
    for (const auto& rule : oom_rules_) {
        if (rule.matches(ctx)) {
            out.push_back(rule.render(ctx));
            oom = true;
            break;
        }
    }
    for (const auto& rule : metric_rules_) {
        if (oom && rule.skip_after_oom) {
            continue;
        }
        if (rule.matches(ctx)) {
            out.push_back(rule.render(ctx));
        }
    }
    if (!out.empty()) {
        return out;
    }

    for (const auto& rule : keyword_rules_) {
        if (rule.matches(ctx)) {
            return {rule.render(ctx)};
        }
    }
    return {fmt::format("{}: Review logs and metrics around this event for deeper context", service)};
}

} // namespace logrca::rca
