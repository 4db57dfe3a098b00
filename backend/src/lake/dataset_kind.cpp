#include "dataset_kind.hpp"

#include <stdexcept>

const char* to_cstr(DatasetKind k)
{
    switch (k) {
        case DatasetKind::OptionQuote: return "option_quote";
        case DatasetKind::OptionEod:   return "option_eod";
        case DatasetKind::StockQuote:  return "stock_quote";
        case DatasetKind::StockEod:    return "stock_eod";
        case DatasetKind::Earnings:    return "earnings";
    }
    return "unknown";
}

DatasetKind parse_dataset_kind(std::string_view name)
{
    for (auto k : kAllDatasetKinds) {
        if (name == to_cstr(k)) return k;
    }
    throw std::invalid_argument("unknown dataset kind '" + std::string(name) + "'");
}

std::string endpoint_of(DatasetKind k)
{
    switch (k) {
        case DatasetKind::OptionQuote:
        case DatasetKind::StockQuote:
            return "quote";
        case DatasetKind::OptionEod:
        case DatasetKind::StockEod:
            return "eod";
        case DatasetKind::Earnings:
            return "";
    }
    return "";
}

DatasetKind underlying_kind(DatasetKind k)
{
    switch (k) {
        case DatasetKind::OptionQuote: return DatasetKind::StockQuote;
        case DatasetKind::OptionEod:   return DatasetKind::StockEod;
        case DatasetKind::StockQuote:
        case DatasetKind::StockEod:
            return k;
        case DatasetKind::Earnings:
            break;
    }
    throw std::invalid_argument(std::string("no underlying kind for ") + to_cstr(k));
}
