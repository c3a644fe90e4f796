#include <gtest/gtest.h>
#include <chrono>
#include <string>

#include "time_resolution.h"

using logrca::FormatIsoTime;
using logrca::ParseIsoTime;

TEST(TimeParsingTest, ParseRespectsZulu) {
    auto tp = ParseIsoTime("2024-01-01T00:00:00Z");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(std::chrono::system_clock::to_time_t(*tp), 1704067200);
}

TEST(TimeParsingTest, ParseAcceptsUtcOffsetAndFraction) {
    auto a = ParseIsoTime("2024-02-29T12:00:00+00:00");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(std::chrono::system_clock::to_time_t(*a), 1709208000);

    auto b = ParseIsoTime("2024-02-29T12:00:00.250Z");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::milliseconds>(*b - *a).count(), 250);
}

TEST(TimeParsingTest, ParseRejectsGarbage) {
    EXPECT_FALSE(ParseIsoTime("").has_value());
    EXPECT_FALSE(ParseIsoTime("yesterday at noon").has_value());
    EXPECT_FALSE(ParseIsoTime("2024-01-01T00:00:00.Z").has_value());
}

TEST(TimeParsingTest, FormatIsMicrosecondZulu) {
    auto tp = ParseIsoTime("2024-01-01T00:00:01.5Z");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(FormatIsoTime(*tp), "2024-01-01T00:00:01.500000Z");
    EXPECT_EQ(ParseIsoTime(FormatIsoTime(*tp)), tp);
}
