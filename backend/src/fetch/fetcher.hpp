#pragma once
#include <memory>

#include "lake/request_expander.hpp"
#include "normalize/raw_payload.hpp"

// Upstream data provider capability. Implementations must be callable concurrently.
struct IFetcher
{
    virtual ~IFetcher() = default;
    // Returns the payload (possibly flagged no_data), or throws TransientFetchError /
    // PermanentFetchError.
    virtual RawPayload fetch(const SubRequest &sr) = 0;
};

// Single attempt over libcurl. Provider 472 "no data" becomes a no_data payload;
// connection failures, 429 and 5xx are transient; timeouts and other statuses permanent.
std::unique_ptr<IFetcher> make_curl_fetcher(long timeout_s);

// base * 2^attempt, saturating at kMaxBackoffMs.
constexpr long kMaxBackoffMs = 60'000;
long backoff_delay_ms(long base_ms, int attempt);

// Retries transient failures with exponential backoff (base, 2*base, 4*base ...).
// Exhausted retries surface as PermanentFetchError.
std::unique_ptr<IFetcher> make_retrying_fetcher(std::unique_ptr<IFetcher> inner, int max_retries,
                                                long backoff_base_ms = 100);
