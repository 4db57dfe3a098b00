#include "minio_store.hpp"
#include "sigv4.hpp"
#include "lake/errors.hpp"
#include "util/curl_http.hpp"
#include "util/log.hpp"

#include <algorithm>

namespace
{
    std::string xml_unescape(std::string_view s)
    {
        std::string out;
        out.reserve(s.size());
        for (std::size_t i = 0; i < s.size(); ++i) {
            if (s[i] != '&') {
                out.push_back(s[i]);
                continue;
            }
            auto semi = s.find(';', i);
            if (semi == std::string_view::npos) {
                out.push_back(s[i]);
                continue;
            }
            auto ent = s.substr(i + 1, semi - i - 1);
            if (ent == "amp")       out.push_back('&');
            else if (ent == "lt")   out.push_back('<');
            else if (ent == "gt")   out.push_back('>');
            else if (ent == "quot") out.push_back('"');
            else if (ent == "apos") out.push_back('\'');
            else {
                out.append(s.substr(i, semi - i + 1));
            }
            i = semi;
        }
        return out;
    }

    // Text of every <tag>...</tag> in order.
    std::vector<std::string> tag_values(std::string_view xml, std::string_view tag)
    {
        const std::string open = "<" + std::string(tag) + ">";
        const std::string close = "</" + std::string(tag) + ">";
        std::vector<std::string> out;
        std::size_t pos = 0;
        while ((pos = xml.find(open, pos)) != std::string_view::npos) {
            pos += open.size();
            auto end = xml.find(close, pos);
            if (end == std::string_view::npos) break;
            out.push_back(xml_unescape(xml.substr(pos, end - pos)));
            pos = end + close.size();
        }
        return out;
    }
}

ListObjectsPage parse_list_objects(std::string_view xml)
{
    ListObjectsPage page;
    page.keys = tag_values(xml, "Key");
    auto truncated = tag_values(xml, "IsTruncated");
    page.truncated = !truncated.empty() && truncated.front() == "true";
    auto token = tag_values(xml, "NextContinuationToken");
    if (!token.empty()) page.next_token = token.front();
    return page;
}

class MinioObjectStore final : public IObjectStore
{
public:
    explicit MinioObjectStore(MinioOptions opts) : opts_(std::move(opts))
    {
        cred_.access_key = opts_.access_key;
        cred_.secret_key = opts_.secret_key;
        cred_.region = opts_.region;
        ensure_bucket();
    }

    void put(const std::string &key, const Bytes &bytes) override
    {
        std::string body(bytes.begin(), bytes.end());
        auto res = send("PUT", object_path(key), {}, std::move(body));
        if (res.status != 200) {
            throw StorageError("PUT " + key + " failed: HTTP " + std::to_string(res.status) + " " + res.body);
        }
        log_debug("minio") << "put " << key << " (" << bytes.size() << " bytes)";
    }

    std::optional<Bytes> get(const std::string &key) const override
    {
        auto res = send("GET", object_path(key), {}, {});
        if (res.status == 404) return std::nullopt;
        if (res.status != 200) {
            throw StorageError("GET " + key + " failed: HTTP " + std::to_string(res.status));
        }
        return Bytes(res.body.begin(), res.body.end());
    }

    bool exists(const std::string &key) const override
    {
        auto res = send("HEAD", object_path(key), {}, {});
        if (res.status == 200) return true;
        if (res.status == 404) return false;
        throw StorageError("HEAD " + key + " failed: HTTP " + std::to_string(res.status));
    }

    std::vector<std::string> list(const std::string &prefix) const override
    {
        std::vector<std::string> keys;
        std::string token;
        while (true) {
            std::vector<std::pair<std::string, std::string>> query = {
                {"list-type", "2"},
                {"prefix", prefix},
            };
            if (!token.empty()) query.emplace_back("continuation-token", token);

            auto res = send("GET", "/" + opts_.bucket, query, {});
            if (res.status != 200) {
                throw StorageError("list '" + prefix + "' failed: HTTP " + std::to_string(res.status));
            }
            auto page = parse_list_objects(res.body);
            keys.insert(keys.end(), page.keys.begin(), page.keys.end());
            if (!page.truncated || page.next_token.empty()) break;
            token = std::move(page.next_token);
        }
        std::sort(keys.begin(), keys.end());
        return keys;
    }

    std::string describe() const override
    {
        return std::string(opts_.secure ? "https://" : "http://") + opts_.endpoint + "/" + opts_.bucket;
    }

private:
    std::string object_path(const std::string &key) const
    {
        return "/" + opts_.bucket + "/" + uri_encode(key, false);
    }

    HttpResponse send(const std::string &method,
                      const std::string &path,
                      std::vector<std::pair<std::string, std::string>> query,
                      std::string body) const
    {
        const auto signed_req = sign_request(cred_, method, opts_.endpoint, path, query,
                                             sha256_hex(body), amz_now());

        std::string qs;
        for (const auto &[k, v] : query) {
            qs += qs.empty() ? "?" : "&";
            qs += uri_encode(k, true) + "=" + uri_encode(v, true);
        }

        HttpRequest req;
        req.method = method;
        req.url = std::string(opts_.secure ? "https://" : "http://") + opts_.endpoint + path + qs;
        req.headers = signed_req.headers;
        req.body = std::move(body);
        req.timeout_s = opts_.timeout_s;
        try {
            return http_perform(req);
        } catch (const CurlError &e) {
            throw StorageError(std::string("object store unreachable: ") + e.what());
        }
    }

    void ensure_bucket()
    {
        auto res = send("HEAD", "/" + opts_.bucket, {}, {});
        if (res.status == 200) {
            log_info("minio") << "bucket " << opts_.bucket << " ready at " << opts_.endpoint;
            return;
        }
        if (res.status != 404) {
            throw StorageError("HEAD bucket " + opts_.bucket + " failed: HTTP " + std::to_string(res.status));
        }
        auto created = send("PUT", "/" + opts_.bucket, {}, {});
        if (created.status != 200) {
            throw StorageError("create bucket " + opts_.bucket + " failed: HTTP " +
                               std::to_string(created.status) + " " + created.body);
        }
        log_info("minio") << "created bucket " << opts_.bucket;
    }

    MinioOptions opts_;
    SigV4Credentials cred_;
};

std::unique_ptr<IObjectStore> make_minio_store(const MinioOptions &opts)
{
    return std::make_unique<MinioObjectStore>(opts);
}
