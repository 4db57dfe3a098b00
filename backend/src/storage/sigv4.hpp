#pragma once
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// AWS Signature Version 4 for path-style S3 requests (MinIO).

std::string sha256_hex(std::string_view data);
// Raw 32-byte digest.
std::string hmac_sha256(std::string_view key, std::string_view data);
std::string to_hex(std::string_view raw);

// RFC 3986 unreserved characters pass through; '/' too unless encode_slash.
std::string uri_encode(std::string_view s, bool encode_slash);

struct SigV4Credentials {
    std::string access_key;
    std::string secret_key;
    std::string region{"us-east-1"};
    std::string service{"s3"};
};

// HMAC chain "AWS4"+secret -> date -> region -> service -> "aws4_request". Raw bytes.
std::string signing_key(const SigV4Credentials& cred, std::string_view date);

struct SignedRequest {
    std::string canonical_request;
    std::string string_to_sign;
    std::string authorization;
    // Headers to send: Authorization, x-amz-date, x-amz-content-sha256.
    std::vector<std::pair<std::string, std::string>> headers;
};

// `canonical_uri` is already encoded; `query` holds decoded (key, value) pairs in any order.
// `amz_date` is "YYYYMMDDTHHMMSSZ".
SignedRequest sign_request(const SigV4Credentials& cred,
                           std::string_view method,
                           std::string_view host,
                           std::string_view canonical_uri,
                           std::vector<std::pair<std::string, std::string>> query,
                           std::string_view payload_sha256_hex,
                           std::string_view amz_date);

// Current UTC time as "YYYYMMDDTHHMMSSZ".
std::string amz_now();
