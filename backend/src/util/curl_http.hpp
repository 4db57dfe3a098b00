#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Thin blocking libcurl wrapper shared by the provider fetcher and the S3 client.
// One easy handle per request; safe to call from any worker thread.

struct CurlError : std::runtime_error {
    CurlError(int code, bool timed_out, const std::string& what)
        : std::runtime_error(what), code(code), timed_out(timed_out) {}
    int code;
    bool timed_out;
};

struct HttpRequest {
    std::string method{"GET"};
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    long timeout_s{60};
};

struct HttpResponse {
    long status{0};
    std::string body;
};

// Throws CurlError when no HTTP status was obtained (DNS, connect, timeout ...).
HttpResponse http_perform(const HttpRequest& req);
