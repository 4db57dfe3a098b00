#include "storage/sigv4.hpp"
#include "storage/minio_store.hpp"

#include <gtest/gtest.h>

class sigv4_test : public ::testing::Test {
public:
    static SigV4Credentials creds() {
        SigV4Credentials c;
        c.access_key = "minioadmin";
        c.secret_key = "minioadmin123";
        return c;
    }
};

TEST_F(sigv4_test, sha256) {
    EXPECT_EQ("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", sha256_hex(""));
    EXPECT_EQ("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", sha256_hex("abc"));
}

TEST_F(sigv4_test, hmac_rfc4231_case2) {
    EXPECT_EQ("5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843",
              to_hex(hmac_sha256("Jefe", "what do ya want for nothing?")));
}

TEST_F(sigv4_test, derived_signing_key) {
    SigV4Credentials c;
    c.secret_key = "wJalrXUtnFEMI/K7MDENG+bPxRfiCYEXAMPLEKEY";
    c.region = "us-east-1";
    c.service = "iam";
    EXPECT_EQ("f4780e2d9f65fa895f9c67b32ce1baf0b0d8a43505a000a1a9e090d414db404d",
              to_hex(signing_key(c, "20120215")));
}

TEST_F(sigv4_test, uri_encoding) {
    EXPECT_EQ("a%20b/c", uri_encode("a b/c", false));
    EXPECT_EQ("a%20b%2Fc", uri_encode("a b/c", true));
    EXPECT_EQ("A-z_0.9~", uri_encode("A-z_0.9~", true));
    EXPECT_EQ("%2A%3D%26", uri_encode("*=&", true));
}

TEST_F(sigv4_test, canonical_request_layout) {
    const std::string empty_hash = sha256_hex("");
    auto s = sign_request(creds(), "GET", "localhost:9000", "/betedge-data",
                          {{"prefix", "earnings/"}, {"list-type", "2"}},
                          empty_hash, "20240102T030405Z");

    EXPECT_EQ("GET\n"
              "/betedge-data\n"
              "list-type=2&prefix=earnings%2F\n"
              "host:localhost:9000\n"
              "x-amz-content-sha256:" + empty_hash + "\n"
              "x-amz-date:20240102T030405Z\n"
              "\n"
              "host;x-amz-content-sha256;x-amz-date\n" + empty_hash,
              s.canonical_request);

    EXPECT_EQ("AWS4-HMAC-SHA256\n20240102T030405Z\n20240102/us-east-1/s3/aws4_request\n" +
                  sha256_hex(s.canonical_request),
              s.string_to_sign);

    const std::string prefix = "AWS4-HMAC-SHA256 Credential=minioadmin/20240102/us-east-1/s3/aws4_request, "
                               "SignedHeaders=host;x-amz-content-sha256;x-amz-date, Signature=";
    ASSERT_EQ(prefix.size() + 64, s.authorization.size());
    EXPECT_EQ(prefix, s.authorization.substr(0, prefix.size()));
    EXPECT_EQ(to_hex(hmac_sha256(signing_key(creds(), "20240102"), s.string_to_sign)),
              s.authorization.substr(prefix.size()));

    ASSERT_EQ(3, s.headers.size());
    EXPECT_EQ("Authorization", s.headers[0].first);
}

TEST_F(sigv4_test, signature_depends_on_secret) {
    auto other = creds();
    other.secret_key = "different";
    auto a = sign_request(creds(), "PUT", "localhost:9000", "/b/k", {}, sha256_hex("x"), "20240102T030405Z");
    auto b = sign_request(other, "PUT", "localhost:9000", "/b/k", {}, sha256_hex("x"), "20240102T030405Z");
    EXPECT_EQ(a.canonical_request, b.canonical_request);
    EXPECT_NE(a.authorization, b.authorization);
    EXPECT_THROW(sign_request(creds(), "GET", "h", "/", {}, sha256_hex(""), "2024"), std::invalid_argument);
}

TEST_F(sigv4_test, amz_now_format) {
    auto now = amz_now();
    ASSERT_EQ(16, now.size());
    EXPECT_EQ('T', now[8]);
    EXPECT_EQ('Z', now[15]);
}

TEST_F(sigv4_test, list_objects_page) {
    const char* xml =
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
        "<ListBucketResult xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">"
        "<Name>betedge-data</Name><Prefix>earnings/</Prefix><KeyCount>2</KeyCount>"
        "<IsTruncated>true</IsTruncated>"
        "<NextContinuationToken>1Bx&amp;2</NextContinuationToken>"
        "<Contents><Key>earnings/2024/01/data.msgpack</Key><Size>10</Size></Contents>"
        "<Contents><Key>earnings/2024/02/a&amp;b.msgpack</Key><Size>12</Size></Contents>"
        "</ListBucketResult>";
    auto page = parse_list_objects(xml);
    ASSERT_EQ(2, page.keys.size());
    EXPECT_EQ("earnings/2024/01/data.msgpack", page.keys[0]);
    EXPECT_EQ("earnings/2024/02/a&b.msgpack", page.keys[1]);
    EXPECT_TRUE(page.truncated);
    EXPECT_EQ("1Bx&2", page.next_token);

    auto last = parse_list_objects("<ListBucketResult><IsTruncated>false</IsTruncated></ListBucketResult>");
    EXPECT_TRUE(last.keys.empty());
    EXPECT_FALSE(last.truncated);
}
