#include "request_expander.hpp"

#include <boost/url.hpp>

#include <stdexcept>

namespace urls = boost::urls;

namespace
{
    urls::url parse_base(const std::string& s)
    {
        auto parsed = urls::parse_uri(s);
        if (!parsed) {
            throw std::invalid_argument("invalid URL '" + s + "': " + parsed.error().message());
        }
        return urls::url(*parsed);
    }
}

RequestExpander::RequestExpander(std::string theta_base_url) : theta_base_(std::move(theta_base_url))
{
    while (!theta_base_.empty() && theta_base_.back() == '/') theta_base_.pop_back();
    parse_base(theta_base_);
}

std::vector<PartitionPlan> RequestExpander::plan(const LogicalRequest& req) const
{
    validate(req, RequestUse::Write);

    const PartitionScope scope = req.scope();
    const bool daily = scope.granularity == FileGranularity::Daily;

    std::vector<PartitionPlan> out;
    for (auto& [ym, days] : trading_days_by_month(*req.start, req.end_or_start())) {
        if (daily) {
            for (const auto& d : days) {
                out.push_back(PartitionPlan{PartitionAddressing::key_for(scope, d), {d}});
            }
        } else {
            out.push_back(PartitionPlan{PartitionAddressing::key_for(scope, ym), std::move(days)});
        }
    }
    return out;
}

std::vector<SubRequest> RequestExpander::expand(const LogicalRequest& req,
                                                const std::vector<PartitionPlan>& partitions) const
{
    std::vector<SubRequest> out;
    auto add = [&](const PartitionKey& key, DatasetKind kind, std::string url, ContentType ct, bool underlying) {
        SubRequest sr;
        sr.slot = out.size();
        sr.kind = kind;
        sr.url = std::move(url);
        sr.key = key;
        sr.content_type = ct;
        sr.underlying = underlying;
        sr.root = req.symbol;
        if (kind == DatasetKind::Earnings) sr.headers = earnings_headers();
        out.push_back(std::move(sr));
    };

    for (const auto& p : partitions) {
        switch (req.kind) {
            case DatasetKind::StockQuote:
            case DatasetKind::StockEod:
                for (const auto& d : p.days) add(p.key, req.kind, stock_url(req.kind, req, d), ContentType::Csv, false);
                break;
            case DatasetKind::OptionQuote:
            case DatasetKind::OptionEod:
                for (const auto& d : p.days) {
                    add(p.key, req.kind, stock_url(underlying_kind(req.kind), req, d), ContentType::Csv, true);
                }
                for (const auto& d : p.days) add(p.key, req.kind, option_url(req.kind, req, d), ContentType::Csv, false);
                break;
            case DatasetKind::Earnings:
                for (const auto& d : p.days) add(p.key, req.kind, earnings_url(d), ContentType::Json, false);
                break;
        }
    }
    return out;
}

std::string RequestExpander::provider_url(const std::string& path, const LogicalRequest& req,
                                          DatasetKind kind, const Date& day) const
{
    urls::url u = parse_base(theta_base_ + path + endpoint_of(kind));
    auto params = u.params();
    params.append({"root", req.symbol});
    params.append({"exp", std::to_string(req.expiration)});
    if (!is_eod(kind)) params.append({"ivl", std::to_string(req.interval_ms)});
    params.append({"use_csv", "true"});
    const std::string date = day.compact();
    params.append({"start_date", date});
    params.append({"end_date", date});
    return std::string(u.buffer());
}

std::string RequestExpander::stock_url(DatasetKind kind, const LogicalRequest& req, const Date& day) const
{
    return provider_url("/hist/stock/", req, kind, day);
}

std::string RequestExpander::option_url(DatasetKind kind, const LogicalRequest& req, const Date& day) const
{
    return provider_url("/bulk_hist/option/", req, kind, day);
}

std::string RequestExpander::earnings_url(const Date& day)
{
    urls::url u = parse_base(kEarningsUrl);
    u.params().append({"date", day.dashed()});
    return std::string(u.buffer());
}

const HeaderList& RequestExpander::earnings_headers()
{
    static const HeaderList headers = {
        {"authority", "api.nasdaq.com"},
        {"accept", "application/json, text/plain, */*"},
        {"user-agent", "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 "
                       "(KHTML, like Gecko) Chrome/83.0.4103.116 Safari/537.36"},
        {"origin", "https://www.nasdaq.com"},
        {"sec-fetch-site", "same-site"},
        {"sec-fetch-mode", "cors"},
        {"sec-fetch-dest", "empty"},
        {"referer", "https://www.nasdaq.com/"},
        {"accept-language", "en-US,en;q=0.9"},
    };
    return headers;
}

std::string RequestExpander::probe_url() const
{
    urls::url u = parse_base(theta_base_ + "/list/dates/stock/quote");
    u.params().append({"root", "AAPL"});
    return std::string(u.buffer());
}
