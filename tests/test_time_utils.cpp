#include <gtest/gtest.h>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <cmath>

TEST(TimeUtils, ElapsedUnits) {
    EXPECT_EQ(format_elapsed(0.85), "850ms");
    EXPECT_EQ(format_elapsed(8.44), "8.4s");
    EXPECT_EQ(format_elapsed(862.0), "14m22s");
    EXPECT_EQ(format_elapsed(9300.0), "2h35m");
}

TEST(TimeUtils, ElapsedClampsNegativeAndNaN) {
    EXPECT_EQ(format_elapsed(-3.0), "0ms");
    EXPECT_EQ(format_elapsed(std::nan("")), "0ms");
}

TEST(TimeUtils, ElapsedJustUnderAMinuteStaysSeconds) {
    EXPECT_EQ(format_elapsed(59.94), "59.9s");
}

TEST(TimeUtils, TimestampShortForm) {
    EXPECT_EQ(format_timestamp("2025-01-15T14:35:22Z"), "Jan 15 14:35");
    EXPECT_EQ(format_timestamp("2025-12-03T00:05:00"), "Dec 3 00:05");
}

TEST(TimeUtils, TimestampEmptyOrGarbage) {
    EXPECT_EQ(format_timestamp(""), "-");
    EXPECT_EQ(format_timestamp("garbage"), "?");
    EXPECT_EQ(format_timestamp("2025-13-01T00:00:00Z"), "?");
}

TEST(TimeUtils, NowIsUtcIso) {
    std::string now = now_iso();
    ASSERT_EQ(now.size(), 20u);
    EXPECT_EQ(now[10], 'T');
    EXPECT_EQ(now.back(), 'Z');
    EXPECT_NE(format_timestamp(now), "?");
}
