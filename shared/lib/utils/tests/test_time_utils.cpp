/**
 * @file test_time_utils.cpp
 * @brief Unit tests for time utility functions
 */

#include <gtest/gtest.h>
#include <caload/utils/time_utils.h>

using namespace caload::utils;

TEST(TimeUtilsTest, FormatIso8601_Epoch) {
    std::chrono::system_clock::time_point epoch{};
    EXPECT_EQ(formatIso8601(epoch), "1970-01-01T00:00:00Z");
}

TEST(TimeUtilsTest, FormatIso8601_KnownInstant) {
    // 2026-02-02T12:34:56Z
    auto tp = std::chrono::system_clock::from_time_t(1770035696);
    EXPECT_EQ(formatIso8601(tp), "2026-02-02T12:34:56Z");
}

TEST(TimeUtilsTest, FormatIso8601_WithMilliseconds) {
    auto tp = std::chrono::system_clock::from_time_t(1770035696) + std::chrono::milliseconds(7);
    EXPECT_EQ(formatIso8601(tp, true), "2026-02-02T12:34:56.007Z");
}

TEST(TimeUtilsTest, ToSeconds_Fractional) {
    EXPECT_DOUBLE_EQ(toSeconds(std::chrono::milliseconds(1500)), 1.5);
    EXPECT_DOUBLE_EQ(toSeconds(std::chrono::steady_clock::duration::zero()), 0.0);
}
