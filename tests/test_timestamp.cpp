#include <gtest/gtest.h>
#include "fdr.hpp"

#include <chrono>

class TimestampTest : public ::testing::Test {
protected:
    void SetUp() override {
        base = *fdr::parse_timestamp("2025-09-19T09:00:00Z");
    }

    void TearDown() override {}

    fdr::Timestamp base;
};

TEST_F(TimestampTest, AcceptedFormatsAgree) {
    EXPECT_EQ(*fdr::parse_timestamp("2025-09-19 09:00:00"), base);
    EXPECT_EQ(*fdr::parse_timestamp("2025-09-19T09:00"), base);
    EXPECT_EQ(*fdr::parse_timestamp("2025-09-19T11:00:00+02:00"), base);
    EXPECT_EQ(*fdr::parse_timestamp("2025-09-19T04:00:00-0500"), base);
    EXPECT_EQ(*fdr::parse_timestamp(" 2025-09-19T09:00:00Z "), base);
}

TEST_F(TimestampTest, DateOnlyIsMidnightUtc) {
    auto midnight = fdr::parse_timestamp("2025-09-19");
    ASSERT_TRUE(midnight.has_value());
    EXPECT_EQ(base - *midnight, std::chrono::hours(9));
}

TEST_F(TimestampTest, FractionalSecondsToMicroseconds) {
    auto t = fdr::parse_timestamp("2025-09-19T09:00:00.25Z");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(*t - base, std::chrono::milliseconds(250));
    EXPECT_EQ(fdr::format_timestamp(*t), "2025-09-19T09:00:00.250000Z");
}

TEST_F(TimestampTest, RejectsMalformedInput) {
    EXPECT_FALSE(fdr::parse_timestamp("").has_value());
    EXPECT_FALSE(fdr::parse_timestamp("not-a-time").has_value());
    EXPECT_FALSE(fdr::parse_timestamp("2025-13-01").has_value());
    EXPECT_FALSE(fdr::parse_timestamp("2025-02-29").has_value());
    EXPECT_FALSE(fdr::parse_timestamp("2025-09-19T25:00:00").has_value());
    EXPECT_FALSE(fdr::parse_timestamp("2025-09-19T09:00:00.").has_value());
    EXPECT_FALSE(fdr::parse_timestamp("2025-09-19T09:00:00Zjunk").has_value());
}

TEST_F(TimestampTest, LeapDayIsValid) {
    EXPECT_TRUE(fdr::parse_timestamp("2024-02-29T00:00:00Z").has_value());
}

TEST_F(TimestampTest, FormatIsIsoUtc) {
    EXPECT_EQ(fdr::format_timestamp(base), "2025-09-19T09:00:00Z");
    EXPECT_EQ(fdr::format_timestamp(fdr::Timestamp{}), "1970-01-01T00:00:00Z");
}

TEST_F(TimestampTest, SecondsConversionRoundsToMicroseconds) {
    EXPECT_EQ(fdr::from_seconds(1.5), std::chrono::microseconds(1500000));
    EXPECT_EQ(fdr::from_seconds(0.0000004), std::chrono::microseconds(0));
    EXPECT_DOUBLE_EQ(fdr::to_seconds(std::chrono::milliseconds(2500)), 2.5);
}

TEST_F(TimestampTest, RangeClamp) {
    fdr::TimeRange range{base, base + std::chrono::seconds(60)};
    EXPECT_EQ(range.clamp(base - std::chrono::seconds(1)), range.min);
    EXPECT_EQ(range.clamp(base + std::chrono::seconds(61)), range.max);
    EXPECT_EQ(range.clamp(base + std::chrono::seconds(30)), base + std::chrono::seconds(30));
    EXPECT_EQ(range.span(), std::chrono::seconds(60));
}
