#pragma once
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "lake/logical_request.hpp"
#include "schema/canonical_table.hpp"
#include "storage/object_store.hpp"

enum class MissingPolicy { Fail, Skip };

const char* to_cstr(MissingPolicy p);
// Throws std::invalid_argument for anything but "fail" / "skip".
MissingPolicy parse_missing_policy(std::string_view s);

// Partitions resolved for one retrieval; decoding happens in collect().
class LazyDataset {
public:
    LazyDataset(DatasetKind kind, std::vector<StoredObject> objects, std::vector<std::string> missing);

    DatasetKind kind() const noexcept { return kind_; }
    std::size_t partition_count() const noexcept { return objects_->size(); }
    std::vector<std::string> keys() const;
    // Patterns omitted under the skip policy.
    const std::vector<std::string>& missing() const noexcept { return missing_; }

    // Decodes and unions every partition in key order. Throws SchemaMismatchError when a
    // stored partition drifts from the registry.
    CanonicalTable collect() const;

private:
    DatasetKind kind_;
    std::shared_ptr<const std::vector<StoredObject>> objects_;
    std::vector<std::string> missing_;
};

class RetrievalScanner {
public:
    explicit RetrievalScanner(std::shared_ptr<const IObjectStore> store);

    // Throws InvalidRangeError for an unresolvable range and, under the fail policy,
    // MissingPartitionError naming the first absent key.
    LazyDataset retrieve(const LogicalRequest& req, MissingPolicy on_missing) const;

private:
    std::shared_ptr<const IObjectStore> store_;
};
