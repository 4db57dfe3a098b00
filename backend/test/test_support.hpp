#pragma once
#include <atomic>
#include <functional>
#include <sstream>
#include <string>

#include "fetch/fetcher.hpp"
#include "fetch/provider_readiness.hpp"
#include "util/log.hpp"

inline const std::string kStockQuoteHeader =
    "ms_of_day,bid_size,bid_exchange,bid,bid_condition,ask_size,ask_exchange,ask,ask_condition,date";

inline const std::string kStockEodHeader =
    "ms_of_day,ms_of_day_2,open,high,low,close,volume,count,bid_size,bid_exchange,bid,bid_condition,"
    "ask_size,ask_exchange,ask,ask_condition,date";

inline const std::string kOptionQuoteHeader = "root,expiration,strike,right," + kStockQuoteHeader;

// `rows` quote rows for one day, one hour apart from the open.
inline std::string stock_quote_csv(long date, int rows = 1)
{
    std::ostringstream os;
    os << kStockQuoteHeader << "\n";
    for (int i = 0; i < rows; ++i) {
        os << 34200000 + i * 3600000 << ",10,1,470.5,0,12,2,470.75,0," << date << "\n";
    }
    return os.str();
}

inline std::string stock_eod_csv(long date)
{
    return kStockEodHeader + "\n" +
           "57600000,57600000,470.1,472.9,469.8,472.65,81234567,912345,5,1,472.6,0,7,2,472.7,0," +
           std::to_string(date) + "\n";
}

inline std::string option_quote_csv(long date)
{
    return kOptionQuoteHeader + "\n" +
           "SPY,20240119,470000,C,34200000,3,5,4.15,50,4,6,4.25,50," + std::to_string(date) + "\n" +
           "SPY,20240119,470000,P,34200000,2,5,3.05,50,9,6,3.15,50," + std::to_string(date) + "\n";
}

// "...&start_date=20240102&..." -> 20240102
inline long start_date_of(const std::string& url)
{
    auto pos = url.find("start_date=");
    return pos == std::string::npos ? 0 : std::stol(url.substr(pos + 11, 8));
}

inline RawPayload payload_for(const SubRequest& sr, std::string body)
{
    RawPayload p;
    p.body = std::move(body);
    p.content_type = sr.content_type;
    p.source_url = sr.url;
    p.root = sr.root;
    p.underlying = sr.underlying;
    return p;
}

class ScriptedFetcher : public IFetcher {
public:
    using Script = std::function<RawPayload(const SubRequest&)>;

    explicit ScriptedFetcher(Script script) : script_(std::move(script)) {}

    RawPayload fetch(const SubRequest& sr) override
    {
        ++calls_;
        return script_(sr);
    }

    int calls() const { return calls_.load(); }

private:
    Script script_;
    std::atomic<int> calls_{0};
};

class StaticReadiness : public IProviderReadiness {
public:
    explicit StaticReadiness(bool ready) : ready_(ready) {}
    bool ready() override { return ready_; }

private:
    bool ready_;
};

// Routes every log line into a buffer for the lifetime of the object.
class LogCapture {
public:
    LogCapture() { set_log_sink(&os_); }
    ~LogCapture() { set_log_sink(nullptr); }
    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::string text() const { return os_.str(); }

private:
    std::ostringstream os_;
};
