#include "sigv4.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <stdexcept>

std::string to_hex(std::string_view raw)
{
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(raw.size() * 2);
    for (unsigned char c : raw) {
        out.push_back(kDigits[c >> 4]);
        out.push_back(kDigits[c & 0x0f]);
    }
    return out;
}

std::string sha256_hex(std::string_view data)
{
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(sha256) failed");
    }
    return to_hex(std::string_view(reinterpret_cast<const char*>(digest), digest_len));
}

std::string hmac_sha256(std::string_view key, std::string_view data)
{
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (!HMAC(EVP_sha256(),
              key.data(),
              static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(data.data()),
              data.size(),
              digest,
              &digest_len)) {
        throw std::runtime_error("HMAC(sha256) failed");
    }
    return std::string(reinterpret_cast<const char*>(digest), digest_len);
}

std::string uri_encode(std::string_view s, bool encode_slash)
{
    static constexpr char kDigits[] = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : s) {
        const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                                c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved || (c == '/' && !encode_slash)) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kDigits[c >> 4]);
            out.push_back(kDigits[c & 0x0f]);
        }
    }
    return out;
}

std::string signing_key(const SigV4Credentials& cred, std::string_view date)
{
    const std::string k_date = hmac_sha256("AWS4" + cred.secret_key, date);
    const std::string k_region = hmac_sha256(k_date, cred.region);
    const std::string k_service = hmac_sha256(k_region, cred.service);
    return hmac_sha256(k_service, "aws4_request");
}

SignedRequest sign_request(const SigV4Credentials& cred,
                           std::string_view method,
                           std::string_view host,
                           std::string_view canonical_uri,
                           std::vector<std::pair<std::string, std::string>> query,
                           std::string_view payload_sha256_hex,
                           std::string_view amz_date)
{
    if (amz_date.size() != 16) throw std::invalid_argument("amz_date must be YYYYMMDDTHHMMSSZ");
    const std::string date(amz_date.substr(0, 8));

    for (auto& [k, v] : query) {
        k = uri_encode(k, true);
        v = uri_encode(v, true);
    }
    std::sort(query.begin(), query.end());
    std::string canonical_query;
    for (const auto& [k, v] : query) {
        if (!canonical_query.empty()) canonical_query += '&';
        canonical_query += k + "=" + v;
    }

    static constexpr const char* kSignedHeaders = "host;x-amz-content-sha256;x-amz-date";

    SignedRequest out;
    out.canonical_request = std::string(method) + "\n" +
                            std::string(canonical_uri) + "\n" +
                            canonical_query + "\n" +
                            "host:" + std::string(host) + "\n" +
                            "x-amz-content-sha256:" + std::string(payload_sha256_hex) + "\n" +
                            "x-amz-date:" + std::string(amz_date) + "\n" +
                            "\n" +
                            kSignedHeaders + "\n" +
                            std::string(payload_sha256_hex);

    const std::string scope = date + "/" + cred.region + "/" + cred.service + "/aws4_request";
    out.string_to_sign = "AWS4-HMAC-SHA256\n" + std::string(amz_date) + "\n" + scope + "\n" +
                         sha256_hex(out.canonical_request);

    const std::string signature = to_hex(hmac_sha256(signing_key(cred, date), out.string_to_sign));
    out.authorization = "AWS4-HMAC-SHA256 Credential=" + cred.access_key + "/" + scope +
                        ", SignedHeaders=" + kSignedHeaders + ", Signature=" + signature;

    out.headers = {
        {"Authorization", out.authorization},
        {"x-amz-date", std::string(amz_date)},
        {"x-amz-content-sha256", std::string(payload_sha256_hex)},
    };
    return out;
}

std::string amz_now()
{
    const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[17];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return buf;
}
