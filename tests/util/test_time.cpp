// VESCROW - Time Utility Tests
// Copyright (c) 2024 VESCROW Developers
// MIT License

#include <gtest/gtest.h>

#include <vescrow/util/time.h>

#include <chrono>
#include <thread>

namespace vescrow {
namespace util {
namespace {

class TimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        DisableMockTime();
    }

    void TearDown() override {
        DisableMockTime();
    }
};

TEST_F(TimeTest, GetTime) {
    int64_t time1 = GetTime();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    int64_t time2 = GetTime();

    EXPECT_GE(time2, time1);
    EXPECT_GT(time1, 1704067200);
}

TEST_F(TimeTest, MockTime) {
    EXPECT_FALSE(IsMockTimeEnabled());

    EnableMockTime();
    EXPECT_TRUE(IsMockTimeEnabled());

    SetMockTime(1000);
    EXPECT_EQ(GetTime(), 1000);

    AdvanceMockTime(SECONDS_PER_WEEK);
    EXPECT_EQ(GetTime(), 1000 + SECONDS_PER_WEEK);

    DisableMockTime();
    EXPECT_FALSE(IsMockTimeEnabled());
    EXPECT_GT(GetTime(), 1000 + SECONDS_PER_WEEK);
}

TEST_F(TimeTest, UnixTimeConversion) {
    int64_t timestamp = 1704067200;  // 2024-01-01 00:00:00 UTC

    auto tp = FromUnixTime(timestamp);
    EXPECT_EQ(ToUnixTime(tp), timestamp);
}

TEST_F(TimeTest, FormatISO8601) {
    EXPECT_EQ(FormatISO8601(1704067200), "2024-01-01T00:00:00Z");
    EXPECT_EQ(FormatISO8601(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(FormatISO8601(1704067200 + 3 * SECONDS_PER_HOUR + 25), "2024-01-01T03:00:25Z");
}

TEST_F(TimeTest, ParseISO8601) {
    auto full = ParseISO8601("2024-01-01T00:00:00Z");
    ASSERT_TRUE(full.has_value());
    EXPECT_EQ(*full, 1704067200);

    auto noZone = ParseISO8601("2024-01-01T12:00:00");
    ASSERT_TRUE(noZone.has_value());
    EXPECT_EQ(*noZone, 1704067200 + 12 * SECONDS_PER_HOUR);

    auto dateOnly = ParseISO8601("2024-01-08");
    ASSERT_TRUE(dateOnly.has_value());
    EXPECT_EQ(*dateOnly, 1704067200 + SECONDS_PER_WEEK);
}

TEST_F(TimeTest, ParseISO8601Invalid) {
    EXPECT_FALSE(ParseISO8601("").has_value());
    EXPECT_FALSE(ParseISO8601("yesterday").has_value());
    EXPECT_FALSE(ParseISO8601("2024-01-01T00:00:00+02").has_value());
}

TEST_F(TimeTest, FormatDuration) {
    EXPECT_EQ(FormatDuration(0), "0s");
    EXPECT_EQ(FormatDuration(45), "45s");
    EXPECT_EQ(FormatDuration(90), "1m 30s");
    EXPECT_EQ(FormatDuration(3661), "1h 1m 1s");
    EXPECT_EQ(FormatDuration(90061), "1d 1h 1m 1s");
    EXPECT_EQ(FormatDuration(SECONDS_PER_WEEK), "7d");
    EXPECT_EQ(FormatDuration(-60), "-1m");
}

} // namespace
} // namespace util
} // namespace vescrow
