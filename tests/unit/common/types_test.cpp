/// @file types_test.cpp
/// @brief Tests for shared domain enumerations

#include <gtest/gtest.h>

#include "common/types.h"

namespace supportpulse {
namespace {

TEST(TypesTest, IssueTypeNamesRoundTrip) {
    for (IssueType type : kAllIssueTypes) {
        auto parsed = ParseIssueType(IssueTypeName(type));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, type);
    }
}

TEST(TypesTest, IssueTypeParseIsExact) {
    EXPECT_EQ(ParseIssueType("technical_support"), IssueType::kTechnicalSupport);
    EXPECT_FALSE(ParseIssueType("Billing").has_value());
    EXPECT_FALSE(ParseIssueType(" billing").has_value());
    EXPECT_FALSE(ParseIssueType("refund").has_value());
    EXPECT_FALSE(ParseIssueType("").has_value());
}

TEST(TypesTest, LevelNames) {
    EXPECT_EQ(LevelName(Level::kLow), "low");
    EXPECT_EQ(LevelName(Level::kMedium), "medium");
    EXPECT_EQ(LevelName(Level::kHigh), "high");
    EXPECT_EQ(ParseLevel("high"), Level::kHigh);
    EXPECT_FALSE(ParseLevel("urgent").has_value());
}

TEST(TypesTest, FormatTimestampIsIso8601Utc) {
    // 2024-01-02T03:04:05.678Z
    const auto time = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(1704164645678LL));

    EXPECT_EQ(FormatTimestamp(time), "2024-01-02T03:04:05.678Z");
}

}  // namespace
}  // namespace supportpulse
