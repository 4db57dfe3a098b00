#include "fetcher.hpp"
#include "lake/errors.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

namespace
{
    class RetryingFetcher final : public IFetcher
    {
    public:
        RetryingFetcher(std::unique_ptr<IFetcher> inner, int max_retries, long backoff_base_ms)
            : inner_(std::move(inner)), max_retries_(max_retries), backoff_base_ms_(backoff_base_ms) {}

        RawPayload fetch(const SubRequest &sr) override
        {
            for (int attempt = 0;; ++attempt) {
                try {
                    return inner_->fetch(sr);
                } catch (const TransientFetchError &e) {
                    if (attempt >= max_retries_) {
                        throw PermanentFetchError("gave up after " + std::to_string(attempt + 1) +
                                                  " attempts: " + e.what());
                    }
                    const long delay_ms = backoff_delay_ms(backoff_base_ms_, attempt);
                    log_warn("fetch") << "attempt " << attempt + 1 << "/" << max_retries_ + 1 << " for slot "
                                      << sr.slot << " failed: " << e.what() << "; retrying in " << delay_ms << "ms";
                    std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
                }
            }
        }

    private:
        std::unique_ptr<IFetcher> inner_;
        int max_retries_;
        long backoff_base_ms_;
    };
}

long backoff_delay_ms(long base_ms, int attempt)
{
    if (base_ms <= 0) return 0;
    long delay = std::min(base_ms, kMaxBackoffMs);
    for (int i = 0; i < attempt && delay < kMaxBackoffMs; ++i) delay *= 2;
    return std::min(delay, kMaxBackoffMs);
}

std::unique_ptr<IFetcher> make_retrying_fetcher(std::unique_ptr<IFetcher> inner, int max_retries,
                                                long backoff_base_ms)
{
    return std::make_unique<RetryingFetcher>(std::move(inner), max_retries, backoff_base_ms);
}
