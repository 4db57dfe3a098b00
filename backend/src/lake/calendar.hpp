#pragma once
#include <compare>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// A calendar day. Construct through from_int/from_parts to get validation.
struct Date {
    int year{1970};
    int month{1};
    int day{1};

    // 20240131 -> {2024, 1, 31}. Throws std::invalid_argument on an impossible date.
    static Date from_int(std::int64_t yyyymmdd);
    static Date from_parts(int year, int month, int day);

    std::int64_t to_int() const { return year * 10000LL + month * 100LL + day; }
    std::string compact() const; // "20240131"
    std::string dashed() const;  // "2024-01-31"

    Date next_day() const;
    bool is_weekend() const;

    auto operator<=>(const Date&) const = default;
};

struct YearMonth {
    int year{1970};
    int month{1};

    // 202401 -> {2024, 1}. Throws std::invalid_argument on a bad month.
    static YearMonth from_int(std::int64_t yyyymm);
    static YearMonth of(const Date& d) { return YearMonth{d.year, d.month}; }

    std::int64_t to_int() const { return year * 100LL + month; }
    YearMonth next() const { return month == 12 ? YearMonth{year + 1, 1} : YearMonth{year, month + 1}; }
    Date first_day() const { return Date{year, month, 1}; }
    Date last_day() const;

    auto operator<=>(const YearMonth&) const = default;
};

// US equity market holidays for a year (observed dates).
std::vector<Date> us_market_holidays(int year);

bool is_market_day(const Date& d);

// Trading days in [start, end], grouped by year-month, ascending.
std::vector<std::pair<YearMonth, std::vector<Date>>> trading_days_by_month(const Date& start, const Date& end);

// Inclusive month walk, December carries into January.
std::vector<YearMonth> months_between(const YearMonth& start, const YearMonth& end);

// 0 -> "tick", 30000 -> "30s", 60000 -> "1m", 3600000 -> "1h", 86400000 -> "1d".
std::string interval_to_string(std::int64_t interval_ms);

// Two-digit, zero padded ("01".."12").
std::string two_digits(int v);
