#include "logical_request.hpp"
#include "errors.hpp"
#include "util/log.hpp"

#include <sstream>

LogicalRequest LogicalRequest::earnings(const YearMonth& start, const YearMonth& end, bool force_refresh)
{
    LogicalRequest r;
    r.kind = DatasetKind::Earnings;
    r.start = start.first_day();
    r.end = end.last_day();
    r.force_refresh = force_refresh;
    return r;
}

PartitionScope LogicalRequest::scope() const
{
    PartitionScope s;
    s.kind = kind;
    s.symbol = kind == DatasetKind::Earnings ? std::string{} : symbol;
    s.granularity = kind == DatasetKind::Earnings ? FileGranularity::Monthly : granularity;
    s.interval_ms = interval_ms;
    return s;
}

std::optional<YearMonth> LogicalRequest::start_month() const
{
    if (!start) return std::nullopt;
    return YearMonth::of(*start);
}

std::optional<YearMonth> LogicalRequest::end_month() const
{
    if (end) return YearMonth::of(*end);
    return start_month();
}

void validate(const LogicalRequest& req, RequestUse use)
{
    if (req.all && use == RequestUse::Write) {
        throw InvalidRangeError("the 'all' range is for retrieval only");
    }
    if (!req.start && !req.all) {
        throw InvalidRangeError("request has no start and no 'all' flag");
    }
    if (req.start && req.end && *req.end < *req.start) {
        throw InvalidRangeError("end " + req.end->compact() + " is before start " + req.start->compact());
    }
    if (req.kind != DatasetKind::Earnings && req.symbol.empty()) {
        throw InvalidRangeError(std::string(to_cstr(req.kind)) + " request needs a symbol");
    }
    if (req.symbol.find('/') != std::string::npos) {
        throw InvalidRangeError("symbol '" + req.symbol + "' contains '/'");
    }
    if (req.interval_ms < 0) {
        throw InvalidRangeError("interval_ms must not be negative");
    }
    if (!is_eod(req.kind) && req.kind != DatasetKind::Earnings &&
        req.interval_ms != 60'000 && req.interval_ms != 3'600'000) {
        log_warn("request") << "interval " << req.interval_ms
                            << "ms: provider performance degrades for intervals other than 1m and 1h";
    }
}

std::string describe(const LogicalRequest& req)
{
    std::ostringstream os;
    os << to_cstr(req.kind);
    if (!req.symbol.empty()) os << " " << req.symbol;
    if (req.all) {
        os << " [all]";
    } else if (req.start) {
        os << " [" << req.start->compact() << ".." << req.end_or_start().compact() << "]";
    }
    os << " " << to_cstr(req.granularity);
    return os.str();
}
