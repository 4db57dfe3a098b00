#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "calendar.hpp"
#include "dataset_kind.hpp"

enum class FileGranularity : std::uint8_t { Monthly = 0, Daily = 1 };

const char* to_cstr(FileGranularity g);
// Throws std::invalid_argument for anything but "monthly" / "daily".
FileGranularity parse_granularity(std::string_view s);

inline constexpr const char* kPartitionExt = "msgpack";

// Everything about a logical request that the key layout depends on, minus time.
struct PartitionScope {
    DatasetKind kind{DatasetKind::StockQuote};
    std::string symbol;                       // ignored for earnings
    FileGranularity granularity{FileGranularity::Monthly};
    std::int64_t interval_ms{3'600'000};      // ignored for eod kinds

    // "historical-options/eod/monthly/1d/SPY", "earnings", ...
    std::string prefix() const;
};

// Deterministic object-store address of one partition file.
struct PartitionKey {
    std::string path;

    bool operator==(const PartitionKey&) const = default;
    bool operator<(const PartitionKey& o) const { return path < o.path; }
};

// What parse_key recovers from a key.
struct PartitionCoordinates {
    DatasetKind kind{DatasetKind::StockQuote};
    std::string symbol;
    FileGranularity granularity{FileGranularity::Monthly};
    std::string interval;
    int year{0};
    int month{0};
    std::optional<int> day;
};

// Key layout shared bit-for-bit by the write path and the retrieval path:
//   historical-options/<endpoint>/<granularity>/<interval>/<ROOT>/<YYYY>/<MM>[/<DD>]/data.msgpack
//   historical-stock/<endpoint>/<granularity>/<interval>/<ROOT>/<YYYY>/<MM>[/<DD>]/data.msgpack
//   earnings/<YYYY>/<MM>/data.msgpack
struct PartitionAddressing {
    static PartitionKey key_for(const PartitionScope& scope, const YearMonth& ym);
    static PartitionKey key_for(const PartitionScope& scope, const Date& day);

    // Ascending keys for [start, end] (end defaults to start). Monthly scopes yield one
    // key per month; daily scopes one key per trading day.
    // Throws InvalidRangeError when start is missing or end < start.
    static std::vector<PartitionKey> keys_for(const PartitionScope& scope,
                                              std::optional<YearMonth> start,
                                              std::optional<YearMonth> end);

    // Retrieval patterns. `all` yields the single wildcard pattern; otherwise the
    // enumerated keys. Throws InvalidRangeError when neither start nor all is given.
    static std::vector<std::string> patterns_for(const PartitionScope& scope,
                                                 std::optional<YearMonth> start,
                                                 std::optional<YearMonth> end,
                                                 bool all);

    static std::string wildcard_pattern(const PartitionScope& scope);

    static std::optional<PartitionCoordinates> parse_key(std::string_view key);
};
