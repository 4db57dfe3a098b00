#pragma once
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "logical_request.hpp"
#include "normalize/raw_payload.hpp"

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// One network-fetchable unit of a job.
struct SubRequest {
    std::size_t slot{0};
    DatasetKind kind{DatasetKind::StockQuote};
    std::string url;
    HeaderList headers;
    PartitionKey key;
    ContentType content_type{ContentType::Csv};
    bool underlying{false};
    std::string root;
};

// One target partition and the trading days that feed it.
struct PartitionPlan {
    PartitionKey key;
    std::vector<Date> days;
};

class RequestExpander {
public:
    static constexpr const char* kDefaultThetaBase = "http://127.0.0.1:25510/v2";
    static constexpr const char* kEarningsUrl = "https://api.nasdaq.com/api/calendar/earnings";

    explicit RequestExpander(std::string theta_base_url = kDefaultThetaBase);

    // Partitions in ascending key-time order. Empty when the range has no trading days.
    std::vector<PartitionPlan> plan(const LogicalRequest& req) const;

    // Sub-requests for the given partitions, slots numbered 0..n-1 in partition order.
    // Option partitions issue the underlying stock series for every day first, then
    // one bulk option request per day.
    std::vector<SubRequest> expand(const LogicalRequest& req, const std::vector<PartitionPlan>& partitions) const;

    std::string stock_url(DatasetKind kind, const LogicalRequest& req, const Date& day) const;
    std::string option_url(DatasetKind kind, const LogicalRequest& req, const Date& day) const;
    static std::string earnings_url(const Date& day);
    static const HeaderList& earnings_headers();

    // Readiness probe target on the provider terminal.
    std::string probe_url() const;

    const std::string& theta_base() const { return theta_base_; }

private:
    std::string provider_url(const std::string& path, const LogicalRequest& req, DatasetKind kind, const Date& day) const;

    std::string theta_base_;
};
