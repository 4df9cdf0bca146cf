#include <gtest/gtest.h>
#include <ctime>
#include <regex>
#include <thread>
#include <vector>
#include "optsim/core/time_utils.hpp"

using namespace optsim;
using namespace optsim::core;

class TimeUtilsTest : public ::testing::Test {};

TEST_F(TimeUtilsTest, SafeGmtimeEpoch) {
    std::time_t epoch = 0;
    std::tm result;

    std::tm* ret = safe_gmtime(&epoch, &result);

    ASSERT_NE(ret, nullptr);
    EXPECT_EQ(ret, &result);
    EXPECT_EQ(result.tm_year, 70);
    EXPECT_EQ(result.tm_mon, 0);
    EXPECT_EQ(result.tm_mday, 1);
    EXPECT_EQ(result.tm_hour, 0);
}

TEST_F(TimeUtilsTest, SafeLocaltimeValidInput) {
    std::time_t now = std::time(nullptr);
    std::tm result;

    std::tm* ret = safe_localtime(&now, &result);

    ASSERT_NE(ret, nullptr);
    EXPECT_GE(result.tm_year, 100);
    EXPECT_GE(result.tm_mon, 0);
    EXPECT_LE(result.tm_mon, 11);
}

TEST_F(TimeUtilsTest, FormattedTimeMatchesPattern) {
    std::string stamp = get_formatted_time("%Y%m%d_%H%M%S", false);
    EXPECT_TRUE(std::regex_match(stamp, std::regex("\\d{8}_\\d{6}"))) << stamp;
}

TEST_F(TimeUtilsTest, ConcurrentGmtimeCalls) {
    std::vector<std::thread> threads;
    std::vector<int> years(8, 0);
    for (size_t i = 0; i < years.size(); ++i) {
        threads.emplace_back([&years, i]() {
            std::time_t t = static_cast<std::time_t>(i) * 365 * 86400;
            std::tm result;
            safe_gmtime(&t, &result);
            years[i] = result.tm_year;
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(years[0], 70);
    EXPECT_EQ(years[5], 74);
}

TEST_F(TimeUtilsTest, MakeDateIsUtcMidnight) {
    Timestamp date = make_date(2024, 3, 15);
    EXPECT_EQ(format_timestamp(date), "2024-03-15 00:00:00");
    EXPECT_EQ(format_date(date), "2024-03-15");
    EXPECT_EQ(floor_to_day(date + std::chrono::hours(17)), date);
}

TEST_F(TimeUtilsTest, DaysBetweenAcrossLeapYear) {
    EXPECT_EQ(days_between(make_date(2024, 2, 28), make_date(2024, 3, 1)), 2);
    EXPECT_EQ(days_between(make_date(2023, 2, 28), make_date(2023, 3, 1)), 1);
    EXPECT_EQ(days_between(make_date(2024, 1, 1), make_date(2025, 1, 1)), 366);
    EXPECT_EQ(days_between(make_date(2024, 1, 10), make_date(2024, 1, 3)), -7);
    EXPECT_EQ(add_days(make_date(2024, 12, 31), 1), make_date(2025, 1, 1));
}

TEST_F(TimeUtilsTest, WeekdayIndexStartsMonday) {
    EXPECT_EQ(weekday_index(make_date(2024, 1, 1)), 0);  // Monday
    EXPECT_EQ(weekday_index(make_date(2024, 1, 5)), 4);  // Friday
    EXPECT_EQ(weekday_index(make_date(2024, 1, 6)), 5);  // Saturday
    EXPECT_EQ(weekday_index(make_date(2024, 1, 7)), 6);  // Sunday
    EXPECT_EQ(weekday_index(make_date(1970, 1, 1)), 3);  // Thursday
}

TEST_F(TimeUtilsTest, ParseDateValid) {
    auto result = parse_date("2024-02-29");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), make_date(2024, 2, 29));

    auto with_time = parse_date("2024-06-21 00:00:00");
    ASSERT_TRUE(with_time.is_ok());
    EXPECT_EQ(with_time.value(), make_date(2024, 6, 21));
}

TEST_F(TimeUtilsTest, ParseDateRejectsInvalid) {
    EXPECT_TRUE(parse_date("").is_error());
    EXPECT_TRUE(parse_date("2024/01/02").is_error());
    EXPECT_TRUE(parse_date("2024-13-01").is_error());
    EXPECT_TRUE(parse_date("2023-02-29").is_error());

    auto result = parse_date("not a date");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}
