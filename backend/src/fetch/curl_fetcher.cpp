#include "fetcher.hpp"
#include "lake/errors.hpp"
#include "util/curl_http.hpp"
#include "util/log.hpp"

namespace
{
    // Provider status for "No data for the specified timeframe".
    constexpr long kNoDataStatus = 472;

    std::string snippet(const std::string& body)
    {
        return body.size() > 200 ? body.substr(0, 200) + "..." : body;
    }

    class CurlFetcher final : public IFetcher
    {
    public:
        explicit CurlFetcher(long timeout_s) : timeout_s_(timeout_s) {}

        RawPayload fetch(const SubRequest &sr) override
        {
            HttpRequest req;
            req.url = sr.url;
            req.headers = sr.headers;
            req.timeout_s = timeout_s_;

            HttpResponse res;
            try {
                res = http_perform(req);
            } catch (const CurlError &e) {
                if (e.timed_out) {
                    throw PermanentFetchError("timed out after " + std::to_string(timeout_s_) + "s: " + sr.url);
                }
                throw TransientFetchError(e.what());
            }

            RawPayload p;
            p.content_type = sr.content_type;
            p.source_url = sr.url;
            p.root = sr.root;
            p.underlying = sr.underlying;

            if (res.status == kNoDataStatus) {
                log_debug("fetch") << "no data: " << sr.url;
                p.no_data = true;
                return p;
            }
            if (res.status == 429 || res.status >= 500) {
                throw TransientFetchError("HTTP " + std::to_string(res.status) + " from " + sr.url);
            }
            if (res.status < 200 || res.status >= 300) {
                throw PermanentFetchError("HTTP " + std::to_string(res.status) + " from " + sr.url + ": " +
                                          snippet(res.body));
            }
            p.body = std::move(res.body);
            log_debug("fetch") << sr.url << " -> " << p.body.size() << " bytes";
            return p;
        }

    private:
        long timeout_s_;
    };
}

std::unique_ptr<IFetcher> make_curl_fetcher(long timeout_s) { return std::make_unique<CurlFetcher>(timeout_s); }
