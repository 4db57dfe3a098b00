#pragma once
#include <array>
#include <memory>

#include "normalizer.hpp"

// DatasetKind -> normalizer lookup. Pure: no network or storage access.
class NormalizerRouter {
public:
    NormalizerRouter();

    // No-data payloads (flagged, or an empty body) become a zero-row table of `kind`.
    // Throws SchemaMismatchError for malformed payloads.
    std::shared_ptr<const CanonicalTable> normalize(const RawPayload& payload, DatasetKind kind) const;

private:
    enum Family : std::size_t { kOption = 0, kStock = 1, kEarnings = 2, kFamilyCount = 3 };

    static Family family_of(DatasetKind kind);
    static ContentType content_type_of(Family f);

    std::array<std::unique_ptr<INormalizer>, kFamilyCount> normalizers_;
};
