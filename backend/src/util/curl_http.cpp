#include "curl_http.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace
{
    std::once_flag g_curl_once;

    size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* s)
    {
        size_t new_length = size * nmemb;
        s->append(static_cast<char*>(contents), new_length);
        return new_length;
    }

    struct EasyDeleter {
        void operator()(CURL* c) const { curl_easy_cleanup(c); }
    };
    struct SlistDeleter {
        void operator()(curl_slist* l) const { curl_slist_free_all(l); }
    };
}

HttpResponse http_perform(const HttpRequest& req)
{
    std::call_once(g_curl_once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

    std::unique_ptr<CURL, EasyDeleter> curl(curl_easy_init());
    if (!curl) throw CurlError(CURLE_FAILED_INIT, false, "curl_easy_init failed");

    curl_slist* raw_headers = nullptr;
    for (const auto& [k, v] : req.headers) {
        raw_headers = curl_slist_append(raw_headers, (k + ": " + v).c_str());
    }
    // libcurl adds "Expect: 100-continue" to PUTs; S3-compatible stores don't need it.
    raw_headers = curl_slist_append(raw_headers, "Expect:");
    std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);

    HttpResponse out;
    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &out.body);
    curl_easy_setopt(h, CURLOPT_TIMEOUT, req.timeout_s);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, "");

    if (req.method == "HEAD") {
        curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
    } else if (req.method != "GET") {
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, req.method.c_str());
    }
    if (!req.body.empty() || req.method == "PUT" || req.method == "POST") {
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, req.body.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body.size()));
    }

    CURLcode res = curl_easy_perform(h);
    if (res != CURLE_OK) {
        throw CurlError(res, res == CURLE_OPERATION_TIMEDOUT,
                        std::string(curl_easy_strerror(res)) + " (" + req.method + " " + req.url + ")");
    }
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &out.status);
    return out;
}
