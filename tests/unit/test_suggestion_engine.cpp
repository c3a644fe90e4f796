#include <gtest/gtest.h>
#include <string>

#include "rca/suggestion_engine.h"

using namespace logrca;
using namespace logrca::anomaly;
using logrca::rca::SuggestionEngine;

namespace {

bool Contains(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

} // namespace

TEST(SuggestionEngineTest, CpuExceedanceMentionsHighCpu) {
    SuggestionEngine engine{ThresholdConfig{}};
    FeatureVector f;
    f.cpu_usage() = 0.9;
    f.cpu_exceedance() = 0.05;

    auto out = engine.Suggest("A", "Connection refused to db", f);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_TRUE(Contains(out[0], "A: High CPU usage (0.90 > 0.85)"));
}

TEST(SuggestionEngineTest, MetricRulesFireInFixedOrder) {
    SuggestionEngine engine{ThresholdConfig{}};
    FeatureVector f;
    f.latency_p95_ms() = 2000.0;
    f.latency_exceedance() = 1000.0;
    f.error_rate() = 0.5;
    f.error_rate_exceedance() = 0.4;
    f.hikaricp_active() = 12.0;
    f.hikaricp_exceedance() = 3.0;

    auto out = engine.Suggest("orders", "request failed", f);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_TRUE(Contains(out[0], "latency"));
    EXPECT_TRUE(Contains(out[1], "error rate"));
    EXPECT_TRUE(Contains(out[2], "connection pool"));
    for (const auto& s : out) {
        EXPECT_EQ(s.rfind("orders: ", 0), 0u);
    }
}

TEST(SuggestionEngineTest, OutOfMemoryWithFullHeapSuppressesHeapRule) {
    SuggestionEngine engine{ThresholdConfig{}};
    FeatureVector f;
    f.jvm_heap_usage_ratio() = 0.97;
    f.heap_ratio_exceedance() = 0.12;

    auto out = engine.Suggest("billing", "java.lang.OutOfMemoryError: Java heap space", f);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_TRUE(Contains(out[0], "memory leak"));
    EXPECT_TRUE(Contains(out[0], "97%"));
}

TEST(SuggestionEngineTest, OutOfMemoryWithLowHeapPointsAtNativeMemory) {
    SuggestionEngine engine{ThresholdConfig{}};
    FeatureVector f;
    f.jvm_heap_usage_ratio() = 0.4;

    auto out = engine.Suggest("billing", "GC overhead limit exceeded", f);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_TRUE(Contains(out[0], "container memory"));
}

TEST(SuggestionEngineTest, HeapRuleFiresWithoutOutOfMemory) {
    SuggestionEngine engine{ThresholdConfig{}};
    FeatureVector f;
    f.jvm_heap_usage_ratio() = 0.95;
    f.heap_ratio_exceedance() = 0.10;

    auto out = engine.Suggest("billing", "slow gc pause", f);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_TRUE(Contains(out[0], "JVM heap usage high"));
}

TEST(SuggestionEngineTest, KeywordFallbackReturnsFirstMatchOnly) {
    SuggestionEngine engine{ThresholdConfig{}};
    FeatureVector quiet;

    auto timeout = engine.Suggest("A", "Read timed out; connection reset by database", quiet);
    ASSERT_EQ(timeout.size(), 1u);
    EXPECT_EQ(timeout[0], "A: Increase timeout or inspect slow dependencies");

    auto db = engine.Suggest("A", "Slow QUERY on orders table", quiet);
    ASSERT_EQ(db.size(), 1u);
    EXPECT_EQ(db[0], "A: Review DB performance or slow queries");

    auto routing = engine.Suggest("web", "No mapping? NoMapping for GET /foo", quiet);
    ASSERT_EQ(routing.size(), 1u);
    EXPECT_EQ(routing[0], "web: Verify controller endpoint or routing config");
}

TEST(SuggestionEngineTest, ExceptionKeywordOutranksDatabaseKeywords) {
    SuggestionEngine engine{ThresholdConfig{}};
    FeatureVector quiet;

    auto out = engine.Suggest("orders", "Exception during query execution", quiet);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], "orders: Check stack trace and root exception");
}

TEST(SuggestionEngineTest, GenericFallbackWhenNothingMatches) {
    SuggestionEngine engine{ThresholdConfig{}};
    auto out = engine.Suggest("A", "something odd", FeatureVector{});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], "A: Review logs and metrics around this event for deeper context");
}

TEST(SuggestionEngineTest, CustomThresholdsAreRendered) {
    ThresholdConfig t;
    t.cpu_usage = 0.5;
    SuggestionEngine engine{t};
    SuggestionEngine copy = engine;
    FeatureVector f;
    f.cpu_usage() = 0.6;
    f.cpu_exceedance() = 0.1;

    auto out = copy.Suggest("A", "x", f);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_TRUE(Contains(out[0], "(0.60 > 0.50)"));
}
