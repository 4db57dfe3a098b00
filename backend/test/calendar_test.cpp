#include "lake/calendar.hpp"

#include <algorithm>
#include <stdexcept>
#include <gtest/gtest.h>

class calendar_test : public ::testing::Test {
};

TEST_F(calendar_test, date_from_int) {
    auto d = Date::from_int(20240131);
    EXPECT_EQ(2024, d.year);
    EXPECT_EQ(1, d.month);
    EXPECT_EQ(31, d.day);
    EXPECT_EQ("20240131", d.compact());
    EXPECT_EQ("2024-01-31", d.dashed());
    EXPECT_EQ(20240131, d.to_int());
}

TEST_F(calendar_test, impossible_dates_rejected) {
    EXPECT_THROW(Date::from_int(20230229), std::invalid_argument);
    EXPECT_THROW(Date::from_int(20241301), std::invalid_argument);
    EXPECT_THROW(Date::from_int(2024011), std::invalid_argument);
    EXPECT_NO_THROW(Date::from_int(20240229));
}

TEST_F(calendar_test, next_day_crosses_year) {
    EXPECT_EQ(Date::from_int(20240101), Date::from_int(20231231).next_day());
    EXPECT_EQ(Date::from_int(20240301), Date::from_int(20240229).next_day());
}

TEST_F(calendar_test, year_month) {
    auto ym = YearMonth::from_int(202402);
    EXPECT_EQ(29, ym.last_day().day);
    EXPECT_EQ(1, ym.first_day().day);
    EXPECT_EQ(YearMonth::from_int(202401), YearMonth::from_int(202312).next());
    EXPECT_THROW(YearMonth::from_int(202413), std::invalid_argument);
    EXPECT_THROW(YearMonth::from_int(202400), std::invalid_argument);
}

TEST_F(calendar_test, months_between_carries_december) {
    auto months = months_between(YearMonth::from_int(202311), YearMonth::from_int(202402));
    ASSERT_EQ(4, months.size());
    EXPECT_EQ(202311, months[0].to_int());
    EXPECT_EQ(202312, months[1].to_int());
    EXPECT_EQ(202401, months[2].to_int());
    EXPECT_EQ(202402, months[3].to_int());

    EXPECT_TRUE(months_between(YearMonth::from_int(202402), YearMonth::from_int(202401)).empty());
}

TEST_F(calendar_test, holidays) {
    EXPECT_FALSE(is_market_day(Date::from_int(20240101)));  // new year
    EXPECT_FALSE(is_market_day(Date::from_int(20240115)));  // mlk
    EXPECT_FALSE(is_market_day(Date::from_int(20240704)));
    EXPECT_FALSE(is_market_day(Date::from_int(20241128)));  // thanksgiving
    EXPECT_FALSE(is_market_day(Date::from_int(20240106)));  // saturday
    EXPECT_TRUE(is_market_day(Date::from_int(20240102)));

    // 2021-07-04 is a Sunday, observed Monday; 2021-12-25 is a Saturday, observed Friday.
    auto h = us_market_holidays(2021);
    EXPECT_NE(h.end(), std::find(h.begin(), h.end(), Date::from_int(20210705)));
    EXPECT_NE(h.end(), std::find(h.begin(), h.end(), Date::from_int(20211224)));
}

TEST_F(calendar_test, trading_days_by_month) {
    auto groups = trading_days_by_month(Date::from_int(20231228), Date::from_int(20240105));
    ASSERT_EQ(2, groups.size());
    EXPECT_EQ(202312, groups[0].first.to_int());
    ASSERT_EQ(2, groups[0].second.size());   // 28, 29
    EXPECT_EQ(202401, groups[1].first.to_int());
    ASSERT_EQ(4, groups[1].second.size());   // 2..5
    EXPECT_EQ(20240102, groups[1].second.front().to_int());

    auto january = trading_days_by_month(Date::from_int(20240101), Date::from_int(20240131));
    ASSERT_EQ(1, january.size());
    EXPECT_EQ(21, january[0].second.size());

    EXPECT_TRUE(trading_days_by_month(Date::from_int(20240106), Date::from_int(20240107)).empty());
}

TEST_F(calendar_test, interval_names) {
    EXPECT_EQ("tick", interval_to_string(0));
    EXPECT_EQ("30s", interval_to_string(30000));
    EXPECT_EQ("1m", interval_to_string(60000));
    EXPECT_EQ("5m", interval_to_string(300000));
    EXPECT_EQ("1h", interval_to_string(3600000));
    EXPECT_EQ("1d", interval_to_string(86400000));
    EXPECT_EQ("07", two_digits(7));
    EXPECT_EQ("12", two_digits(12));
}
