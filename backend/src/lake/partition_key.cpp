#include "partition_key.hpp"
#include "errors.hpp"

#include <charconv>
#include <stdexcept>

namespace
{
    const std::string kDataFile = std::string("data.") + kPartitionExt;

    std::vector<std::string_view> split_path(std::string_view s)
    {
        std::vector<std::string_view> out;
        std::size_t pos = 0;
        while (true) {
            auto slash = s.find('/', pos);
            if (slash == std::string_view::npos) {
                out.push_back(s.substr(pos));
                break;
            }
            out.push_back(s.substr(pos, slash - pos));
            pos = slash + 1;
        }
        return out;
    }

    std::optional<int> parse_fixed_int(std::string_view s, std::size_t width)
    {
        if (s.size() != width) return std::nullopt;
        int v = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
        if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
        return v;
    }
}

const char* to_cstr(FileGranularity g)
{
    return g == FileGranularity::Daily ? "daily" : "monthly";
}

FileGranularity parse_granularity(std::string_view s)
{
    if (s == "monthly") return FileGranularity::Monthly;
    if (s == "daily")   return FileGranularity::Daily;
    throw std::invalid_argument("unknown file granularity '" + std::string(s) + "'");
}

std::string PartitionScope::prefix() const
{
    if (kind == DatasetKind::Earnings) return "earnings";

    const std::string family = is_option(kind) ? "historical-options" : "historical-stock";
    const std::string ivl = is_eod(kind) ? "1d" : interval_to_string(interval_ms);
    return family + "/" + endpoint_of(kind) + "/" + to_cstr(granularity) + "/" + ivl + "/" + symbol;
}

PartitionKey PartitionAddressing::key_for(const PartitionScope& scope, const YearMonth& ym)
{
    return PartitionKey{scope.prefix() + "/" + std::to_string(ym.year) + "/" + two_digits(ym.month) + "/" + kDataFile};
}

PartitionKey PartitionAddressing::key_for(const PartitionScope& scope, const Date& d)
{
    if (scope.kind == DatasetKind::Earnings || scope.granularity == FileGranularity::Monthly) {
        return key_for(scope, YearMonth::of(d));
    }
    return PartitionKey{scope.prefix() + "/" + std::to_string(d.year) + "/" + two_digits(d.month) + "/" +
                        two_digits(d.day) + "/" + kDataFile};
}

std::vector<PartitionKey> PartitionAddressing::keys_for(const PartitionScope& scope,
                                                        std::optional<YearMonth> start,
                                                        std::optional<YearMonth> end)
{
    if (!start) {
        throw InvalidRangeError("a start year-month is required to enumerate partition keys");
    }
    const YearMonth last = end.value_or(*start);
    if (last < *start) {
        throw InvalidRangeError("end " + std::to_string(last.to_int()) + " is before start " +
                                std::to_string(start->to_int()));
    }

    std::vector<PartitionKey> keys;
    const bool daily = scope.granularity == FileGranularity::Daily && scope.kind != DatasetKind::Earnings;
    if (!daily) {
        for (const auto& ym : months_between(*start, last)) {
            keys.push_back(key_for(scope, ym));
        }
        return keys;
    }
    for (const auto& [ym, days] : trading_days_by_month(start->first_day(), last.last_day())) {
        for (const auto& d : days) {
            keys.push_back(key_for(scope, d));
        }
    }
    return keys;
}

std::vector<std::string> PartitionAddressing::patterns_for(const PartitionScope& scope,
                                                           std::optional<YearMonth> start,
                                                           std::optional<YearMonth> end,
                                                           bool all)
{
    if (all) return {wildcard_pattern(scope)};
    if (!start) {
        throw InvalidRangeError("either a start year-month or the 'all' flag must be given");
    }
    std::vector<std::string> out;
    for (auto& k : keys_for(scope, start, end)) {
        out.push_back(std::move(k.path));
    }
    return out;
}

std::string PartitionAddressing::wildcard_pattern(const PartitionScope& scope)
{
    const bool daily = scope.granularity == FileGranularity::Daily && scope.kind != DatasetKind::Earnings;
    return scope.prefix() + (daily ? "/*/*/*/" : "/*/*/") + kDataFile;
}

std::optional<PartitionCoordinates> PartitionAddressing::parse_key(std::string_view key)
{
    const auto parts = split_path(key);
    if (parts.empty() || parts.back() != kDataFile) return std::nullopt;

    PartitionCoordinates c;
    std::size_t ym_at = 0;

    if (parts[0] == "earnings") {
        if (parts.size() != 4) return std::nullopt;
        c.kind = DatasetKind::Earnings;
        ym_at = 1;
    } else {
        if (parts.size() != 8 && parts.size() != 9) return std::nullopt;
        const bool option = parts[0] == "historical-options";
        if (!option && parts[0] != "historical-stock") return std::nullopt;

        if (parts[1] == "quote") {
            c.kind = option ? DatasetKind::OptionQuote : DatasetKind::StockQuote;
        } else if (parts[1] == "eod") {
            c.kind = option ? DatasetKind::OptionEod : DatasetKind::StockEod;
        } else {
            return std::nullopt;
        }
        if (parts[2] == "monthly")    c.granularity = FileGranularity::Monthly;
        else if (parts[2] == "daily") c.granularity = FileGranularity::Daily;
        else return std::nullopt;

        if ((c.granularity == FileGranularity::Daily) != (parts.size() == 9)) return std::nullopt;
        c.interval = std::string(parts[3]);
        c.symbol = std::string(parts[4]);
        if (c.symbol.empty()) return std::nullopt;
        ym_at = 5;
    }

    auto y = parse_fixed_int(parts[ym_at], 4);
    auto m = parse_fixed_int(parts[ym_at + 1], 2);
    if (!y || !m || *m < 1 || *m > 12) return std::nullopt;
    c.year = *y;
    c.month = *m;

    if (c.granularity == FileGranularity::Daily) {
        auto d = parse_fixed_int(parts[ym_at + 2], 2);
        if (!d || *d < 1 || *d > 31) return std::nullopt;
        c.day = *d;
    }
    return c;
}
