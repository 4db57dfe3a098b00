#include "retrieval_scanner.hpp"
#include "lake/errors.hpp"
#include "schema/table_codec.hpp"
#include "util/log.hpp"

#include <stdexcept>

const char* to_cstr(MissingPolicy p)
{
    return p == MissingPolicy::Skip ? "skip" : "fail";
}

MissingPolicy parse_missing_policy(std::string_view s)
{
    if (s == "fail") return MissingPolicy::Fail;
    if (s == "skip") return MissingPolicy::Skip;
    throw std::invalid_argument("unknown missing-partition policy '" + std::string(s) + "'");
}

LazyDataset::LazyDataset(DatasetKind kind, std::vector<StoredObject> objects, std::vector<std::string> missing)
    : kind_(kind)
    , objects_(std::make_shared<const std::vector<StoredObject>>(std::move(objects)))
    , missing_(std::move(missing))
{
}

std::vector<std::string> LazyDataset::keys() const
{
    std::vector<std::string> out;
    out.reserve(objects_->size());
    for (const auto& o : *objects_) out.push_back(o.key);
    return out;
}

CanonicalTable LazyDataset::collect() const
{
    std::vector<std::shared_ptr<const CanonicalTable>> parts;
    parts.reserve(objects_->size());
    for (const auto& o : *objects_) {
        try {
            parts.push_back(std::make_shared<const CanonicalTable>(TableCodec::decode(o.bytes, kind_)));
        } catch (const SchemaMismatchError& e) {
            throw SchemaMismatchError(o.key + ": " + e.what());
        }
    }
    return CanonicalTable::concat(kind_, parts);
}

RetrievalScanner::RetrievalScanner(std::shared_ptr<const IObjectStore> store) : store_(std::move(store))
{
    if (!store_) throw std::invalid_argument("retrieval scanner needs an object store");
}

LazyDataset RetrievalScanner::retrieve(const LogicalRequest& req, MissingPolicy on_missing) const
{
    validate(req, RequestUse::Read);
    const auto patterns = PartitionAddressing::patterns_for(req.scope(), req.start_month(), req.end_month(), req.all);

    auto found = store_->get_many(patterns);

    std::vector<StoredObject> objects;
    std::vector<std::string> missing;
    for (std::size_t i = 0; i < patterns.size(); ++i) {
        if (found[i].empty()) {
            if (on_missing == MissingPolicy::Fail) {
                throw MissingPartitionError(patterns[i]);
            }
            log_warn("retrieve") << "missing partition " << patterns[i] << ", skipped";
            missing.push_back(patterns[i]);
            continue;
        }
        for (auto& o : found[i]) objects.push_back(std::move(o));
    }

    log_info("retrieve") << describe(req) << ": " << objects.size() << " partitions, " << missing.size()
                         << " missing";
    return LazyDataset(req.kind, std::move(objects), std::move(missing));
}
