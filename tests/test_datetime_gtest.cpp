// ==============================================================================
// test_datetime_gtest.cpp - Тесты разбора дат EVE API (GoogleTest)
// ==============================================================================

#include "eveapi/datetime.hpp"

#include <gtest/gtest.h>
#include <string>

namespace eveapi::test {

TEST(DateTimeTest, Parse_ValidDate_AllFields) {
    auto dt = parse_eve_datetime("2011-08-30 22:34:41");
    ASSERT_TRUE(dt.has_value());
    EXPECT_EQ(dt->year, 2011);
    EXPECT_EQ(dt->month, 8);
    EXPECT_EQ(dt->day, 30);
    EXPECT_EQ(dt->hour, 22);
    EXPECT_EQ(dt->minute, 34);
    EXPECT_EQ(dt->second, 41);
}

TEST(DateTimeTest, Parse_FractionalSeconds_Truncated) {
    auto dt = parse_eve_datetime("2011-08-30 22:34:41.123456");
    ASSERT_TRUE(dt.has_value());
    EXPECT_EQ(dt->to_string(), "2011-08-30 22:34:41");
}

TEST(DateTimeTest, Parse_Empty_Nullopt) {
    EXPECT_FALSE(parse_eve_datetime("").has_value());
}

TEST(DateTimeTest, Parse_NullPointer_Nullopt) {
    const std::string* missing = nullptr;
    EXPECT_FALSE(parse_eve_datetime(missing).has_value());
}

TEST(DateTimeTest, Parse_StringPointer_Parsed) {
    std::string text = "2011-08-30 22:37:41";
    auto dt = parse_eve_datetime(&text);
    ASSERT_TRUE(dt.has_value());
    EXPECT_EQ(dt->minute, 37);
}

TEST(DateTimeTest, Parse_Malformed_Nullopt) {
    EXPECT_FALSE(parse_eve_datetime("2011/08/30 22:34:41").has_value());
    EXPECT_FALSE(parse_eve_datetime("2011-08-30T22:34:41").has_value());
    EXPECT_FALSE(parse_eve_datetime("2011-08-30").has_value());
    EXPECT_FALSE(parse_eve_datetime("20x1-08-30 22:34:41").has_value());
    EXPECT_FALSE(parse_eve_datetime("not a date at all!!").has_value());
}

TEST(DateTimeTest, Parse_OutOfRangeFields_Nullopt) {
    EXPECT_FALSE(parse_eve_datetime("2011-13-01 00:00:00").has_value());
    EXPECT_FALSE(parse_eve_datetime("2011-02-29 00:00:00").has_value());
    EXPECT_FALSE(parse_eve_datetime("2011-04-31 00:00:00").has_value());
    EXPECT_FALSE(parse_eve_datetime("2011-01-01 24:00:00").has_value());
    EXPECT_FALSE(parse_eve_datetime("2011-01-01 00:60:00").has_value());
}

TEST(DateTimeTest, Parse_LeapDay_Accepted) {
    auto dt = parse_eve_datetime("2000-02-29 00:00:00");
    ASSERT_TRUE(dt.has_value());
    EXPECT_EQ(dt->to_epoch_seconds(), 951782400);
}

TEST(DateTimeTest, EpochSeconds_KnownValue) {
    auto dt = parse_eve_datetime("2011-08-30 22:34:41");
    ASSERT_TRUE(dt.has_value());
    EXPECT_EQ(dt->to_epoch_seconds(), 1314743681);
}

TEST(DateTimeTest, EpochSeconds_UnixEpoch_Zero) {
    auto dt = parse_eve_datetime("1970-01-01 00:00:00");
    ASSERT_TRUE(dt.has_value());
    EXPECT_EQ(dt->to_epoch_seconds(), 0);
}

TEST(DateTimeTest, SecondsBetween_CacheWindow) {
    auto current = parse_eve_datetime("2011-08-30 22:34:41");
    auto cached = parse_eve_datetime("2011-08-30 22:37:41");
    ASSERT_TRUE(current.has_value());
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(seconds_between(*current, *cached), 180);
    EXPECT_EQ(seconds_between(*cached, *current), -180);
}

TEST(DateTimeTest, SecondsBetween_AcrossMidnight) {
    auto a = parse_eve_datetime("2011-12-31 23:59:30");
    auto b = parse_eve_datetime("2012-01-01 00:00:30");
    EXPECT_EQ(seconds_between(*a, *b), 60);
}

TEST(DateTimeTest, Ordering) {
    auto a = *parse_eve_datetime("2011-08-30 22:34:41");
    auto b = *parse_eve_datetime("2011-08-30 22:37:41");
    EXPECT_LT(a, b);
    EXPECT_LE(a, a);
    EXPECT_GT(b, a);
    EXPECT_GE(b, b);
    EXPECT_EQ(a, *parse_eve_datetime("2011-08-30 22:34:41.999"));
    EXPECT_NE(a, b);
}

TEST(DateTimeTest, ToString_ZeroPadded) {
    DateTime dt;
    dt.year = 2012;
    dt.month = 1;
    dt.day = 2;
    dt.hour = 3;
    dt.minute = 4;
    dt.second = 5;
    EXPECT_EQ(dt.to_string(), "2012-01-02 03:04:05");
}

}  // namespace eveapi::test
