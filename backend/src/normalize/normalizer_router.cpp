#include "normalizer_router.hpp"
#include "lake/errors.hpp"

#include <stdexcept>

NormalizerRouter::NormalizerRouter()
{
    normalizers_[kOption] = make_option_normalizer();
    normalizers_[kStock] = make_stock_normalizer();
    normalizers_[kEarnings] = make_earnings_normalizer();
}

NormalizerRouter::Family NormalizerRouter::family_of(DatasetKind kind)
{
    switch (kind) {
        case DatasetKind::OptionQuote:
        case DatasetKind::OptionEod:  return kOption;
        case DatasetKind::StockQuote:
        case DatasetKind::StockEod:   return kStock;
        case DatasetKind::Earnings:   return kEarnings;
    }
    throw std::invalid_argument("no normalizer for dataset kind " +
                                std::to_string(static_cast<int>(kind)));
}

ContentType NormalizerRouter::content_type_of(Family f)
{
    return f == kEarnings ? ContentType::Json : ContentType::Csv;
}

std::shared_ptr<const CanonicalTable> NormalizerRouter::normalize(const RawPayload& payload, DatasetKind kind) const
{
    const Family family = family_of(kind);

    if (payload.no_data || payload.body.find_first_not_of(" \t\r\n") == std::string::npos) {
        return std::make_shared<const CanonicalTable>(kind);
    }
    if (payload.content_type != content_type_of(family)) {
        throw SchemaMismatchError(std::string(to_cstr(kind)) + " expects a " + to_cstr(content_type_of(family)) +
                                  " payload, got " + to_cstr(payload.content_type));
    }
    return std::make_shared<const CanonicalTable>(normalizers_[family]->normalize(payload, kind));
}
