#pragma once
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "object_store.hpp"

struct MinioOptions {
    std::string endpoint{"localhost:9000"};   // host[:port]
    std::string access_key{"minioadmin"};
    std::string secret_key{"minioadmin123"};
    std::string bucket{"betedge-data"};
    std::string region{"us-east-1"};
    bool secure{false};
    long timeout_s{60};
};

// Path-style S3 client over libcurl with SigV4 signing. Creates the bucket if missing.
// Throws StorageError when the server cannot be reached.
std::unique_ptr<IObjectStore> make_minio_store(const MinioOptions& opts);

// One ListObjectsV2 response page.
struct ListObjectsPage {
    std::vector<std::string> keys;
    bool truncated{false};
    std::string next_token;
};

ListObjectsPage parse_list_objects(std::string_view xml);
