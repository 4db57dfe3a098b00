#include "calendar.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace chr = std::chrono;

namespace
{
    chr::sys_days to_sys(const Date& d)
    {
        return chr::sys_days{chr::year{d.year} / chr::month{static_cast<unsigned>(d.month)} / chr::day{static_cast<unsigned>(d.day)}};
    }

    Date from_sys(chr::sys_days sd)
    {
        chr::year_month_day ymd{sd};
        return Date{static_cast<int>(ymd.year()),
                    static_cast<int>(static_cast<unsigned>(ymd.month())),
                    static_cast<int>(static_cast<unsigned>(ymd.day()))};
    }

    Date nth_weekday(int y, unsigned m, chr::weekday wd, unsigned n)
    {
        return from_sys(chr::sys_days{chr::year{y} / chr::month{m} / wd[n]});
    }

    // Fixed-date holiday moved to Friday/Monday when it falls on a weekend.
    Date observed(int y, unsigned m, unsigned d)
    {
        chr::sys_days sd{chr::year{y} / chr::month{m} / chr::day{d}};
        chr::weekday wd{sd};
        if (wd == chr::Saturday) return from_sys(sd - chr::days{1});
        if (wd == chr::Sunday)   return from_sys(sd + chr::days{1});
        return from_sys(sd);
    }
}

Date Date::from_parts(int y, int m, int d)
{
    chr::year_month_day ymd{chr::year{y}, chr::month{static_cast<unsigned>(m)}, chr::day{static_cast<unsigned>(d)}};
    if (m < 1 || m > 12 || d < 1 || !ymd.ok()) {
        throw std::invalid_argument("invalid date " + std::to_string(y) + "-" + std::to_string(m) + "-" + std::to_string(d));
    }
    return Date{y, m, d};
}

Date Date::from_int(std::int64_t yyyymmdd)
{
    if (yyyymmdd < 10000101 || yyyymmdd > 99991231) {
        throw std::invalid_argument("date must be YYYYMMDD, got " + std::to_string(yyyymmdd));
    }
    return from_parts(static_cast<int>(yyyymmdd / 10000),
                      static_cast<int>((yyyymmdd / 100) % 100),
                      static_cast<int>(yyyymmdd % 100));
}

std::string Date::compact() const
{
    return std::to_string(year) + two_digits(month) + two_digits(day);
}

std::string Date::dashed() const
{
    return std::to_string(year) + "-" + two_digits(month) + "-" + two_digits(day);
}

Date Date::next_day() const { return from_sys(to_sys(*this) + chr::days{1}); }

bool Date::is_weekend() const
{
    chr::weekday wd{to_sys(*this)};
    return wd == chr::Saturday || wd == chr::Sunday;
}

YearMonth YearMonth::from_int(std::int64_t yyyymm)
{
    const int y = static_cast<int>(yyyymm / 100);
    const int m = static_cast<int>(yyyymm % 100);
    if (yyyymm < 100001 || m < 1 || m > 12) {
        throw std::invalid_argument("year-month must be YYYYMM, got " + std::to_string(yyyymm));
    }
    return YearMonth{y, m};
}

Date YearMonth::last_day() const
{
    chr::year_month_day_last ymdl{chr::year{this->year} / chr::month{static_cast<unsigned>(this->month)} / chr::last};
    return Date{this->year, this->month, static_cast<int>(static_cast<unsigned>(ymdl.day()))};
}

std::vector<Date> us_market_holidays(int y)
{
    return {
        Date{y, 1, 1},                                                    // New Year's Day
        nth_weekday(y, 1, chr::Monday, 3),                                // Martin Luther King Jr. Day
        nth_weekday(y, 2, chr::Monday, 3),                                // Presidents Day
        from_sys(chr::sys_days{chr::year{y} / chr::May / chr::Monday[chr::last]}), // Memorial Day
        observed(y, 7, 4),                                                // Independence Day
        nth_weekday(y, 9, chr::Monday, 1),                                // Labor Day
        nth_weekday(y, 11, chr::Thursday, 4),                             // Thanksgiving
        observed(y, 12, 25),                                              // Christmas
    };
}

bool is_market_day(const Date& d)
{
    if (d.is_weekend()) return false;
    const auto holidays = us_market_holidays(d.year);
    return std::find(holidays.begin(), holidays.end(), d) == holidays.end();
}

std::vector<std::pair<YearMonth, std::vector<Date>>> trading_days_by_month(const Date& start, const Date& end)
{
    std::vector<std::pair<YearMonth, std::vector<Date>>> out;
    for (Date cur = start; cur <= end; cur = cur.next_day()) {
        if (!is_market_day(cur)) continue;
        const auto ym = YearMonth::of(cur);
        if (out.empty() || out.back().first != ym) {
            out.emplace_back(ym, std::vector<Date>{});
        }
        out.back().second.push_back(cur);
    }
    return out;
}

std::vector<YearMonth> months_between(const YearMonth& start, const YearMonth& end)
{
    std::vector<YearMonth> out;
    for (YearMonth cur = start; cur <= end; cur = cur.next()) {
        out.push_back(cur);
    }
    return out;
}

std::string interval_to_string(std::int64_t interval_ms)
{
    if (interval_ms == 0)         return "tick";
    if (interval_ms < 60000)      return std::to_string(interval_ms / 1000) + "s";
    if (interval_ms < 3600000)    return std::to_string(interval_ms / 60000) + "m";
    if (interval_ms < 86400000)   return std::to_string(interval_ms / 3600000) + "h";
    return std::to_string(interval_ms / 86400000) + "d";
}

std::string two_digits(int v)
{
    std::string s = std::to_string(v);
    return s.size() < 2 ? "0" + s : s;
}
