#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "calendar.hpp"
#include "dataset_kind.hpp"
#include "partition_key.hpp"

// One caller-level ask for a data range, before fan-out.
struct LogicalRequest {
    DatasetKind kind{DatasetKind::StockQuote};
    std::string symbol;                           // underlying root; empty for earnings

    std::optional<Date> start;
    std::optional<Date> end;                      // defaults to start
    bool all{false};                              // wildcard range, retrieval only

    std::int64_t interval_ms{3'600'000};
    std::int32_t expiration{0};                   // 0 = every expiration
    FileGranularity granularity{FileGranularity::Monthly};
    bool force_refresh{false};

    // Earnings are requested by month: first day of `start` through last day of `end`.
    static LogicalRequest earnings(const YearMonth& start, const YearMonth& end, bool force_refresh = false);

    PartitionScope scope() const;
    Date end_or_start() const { return end.value_or(*start); }
    std::optional<YearMonth> start_month() const;
    std::optional<YearMonth> end_month() const;
};

enum class RequestUse { Write, Read };

// Rejects requests before any I/O. Throws InvalidRangeError.
void validate(const LogicalRequest& req, RequestUse use);

std::string describe(const LogicalRequest& req);
