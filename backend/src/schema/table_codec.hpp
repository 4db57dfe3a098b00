#pragma once
#include "canonical_table.hpp"
#include "util/bytes.hpp"

// Partition file codec. An object carries the dataset name, its column spec and the
// column values; decoding checks the stored spec against the registry.
struct TableCodec {
    static Bytes encode(const CanonicalTable& table);

    // Throws SchemaMismatchError when the object is not a table of `expected`
    // or its stored column spec differs from the registry entry.
    static CanonicalTable decode(const Bytes& bytes, DatasetKind expected);
};
