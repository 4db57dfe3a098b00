#include "provider_readiness.hpp"
#include "util/curl_http.hpp"
#include "util/log.hpp"

namespace
{
    class HttpReadiness final : public IProviderReadiness
    {
    public:
        HttpReadiness(std::string url, long timeout_s) : url_(std::move(url)), timeout_s_(timeout_s) {}

        bool ready() override
        {
            HttpRequest req;
            req.url = url_;
            req.timeout_s = timeout_s_;
            try {
                auto res = http_perform(req);
                if (res.status == 200) return true;
                log_warn("provider") << "probe " << url_ << " returned HTTP " << res.status;
            } catch (const CurlError &e) {
                log_warn("provider") << "probe " << url_ << " failed: " << e.what();
            }
            return false;
        }

    private:
        std::string url_;
        long timeout_s_;
    };
}

std::unique_ptr<IProviderReadiness> make_http_readiness(std::string probe_url, long timeout_s)
{
    return std::make_unique<HttpReadiness>(std::move(probe_url), timeout_s);
}
