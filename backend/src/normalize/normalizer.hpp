#pragma once
#include <memory>

#include "raw_payload.hpp"
#include "schema/canonical_table.hpp"

// Parses one payload family strictly against its registry schema.
struct INormalizer
{
    virtual ~INormalizer() = default;
    // Throws SchemaMismatchError; never coerces.
    virtual CanonicalTable normalize(const RawPayload &payload, DatasetKind kind) const = 0;
};

// factories
std::unique_ptr<INormalizer> make_option_normalizer();
std::unique_ptr<INormalizer> make_stock_normalizer();
std::unique_ptr<INormalizer> make_earnings_normalizer();
