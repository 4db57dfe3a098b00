#include "schema_registry.hpp"

#include <stdexcept>

namespace
{
    const ColumnSpec kQuote = {
        {"ms_of_day",     ColumnType::Int64},
        {"bid_size",      ColumnType::Int32},
        {"bid_exchange",  ColumnType::Int16},
        {"bid",           ColumnType::Float64},
        {"bid_condition", ColumnType::Int16},
        {"ask_size",      ColumnType::Int32},
        {"ask_exchange",  ColumnType::Int16},
        {"ask",           ColumnType::Float64},
        {"ask_condition", ColumnType::Int16},
        {"date",          ColumnType::Int32},
    };

    const ColumnSpec kEod = {
        {"ms_of_day",     ColumnType::Int64},
        {"ms_of_day_2",   ColumnType::Int64},
        {"open",          ColumnType::Float64},
        {"high",          ColumnType::Float64},
        {"low",           ColumnType::Float64},
        {"close",         ColumnType::Float64},
        {"volume",        ColumnType::Int64},
        {"count",         ColumnType::Int64},
        {"bid_size",      ColumnType::Int32},
        {"bid_exchange",  ColumnType::Int16},
        {"bid",           ColumnType::Float64},
        {"bid_condition", ColumnType::Int16},
        {"ask_size",      ColumnType::Int32},
        {"ask_exchange",  ColumnType::Int16},
        {"ask",           ColumnType::Float64},
        {"ask_condition", ColumnType::Int16},
        {"date",          ColumnType::Int32},
    };

    const ColumnSpec kContract = {
        {"root",       ColumnType::String},
        {"expiration", ColumnType::Int32},
        {"strike",     ColumnType::Int64},
        {"right",      ColumnType::String},
    };

    const ColumnSpec kEarnings = {
        {"date",                  ColumnType::String},
        {"symbol",                ColumnType::String},
        {"name",                  ColumnType::String},
        {"time",                  ColumnType::String},
        {"eps",                   ColumnType::Float64},
        {"eps_forecast",          ColumnType::Float64},
        {"surprise_pct",          ColumnType::Float64},
        {"market_cap",            ColumnType::Int64},
        {"fiscal_quarter_ending", ColumnType::String},
        {"num_estimates",         ColumnType::Int64},
    };

    ColumnSpec concat(const ColumnSpec& a, const ColumnSpec& b)
    {
        ColumnSpec out = a;
        out.insert(out.end(), b.begin(), b.end());
        return out;
    }
}

const char* to_cstr(ColumnType t)
{
    switch (t) {
        case ColumnType::Int16:   return "int16";
        case ColumnType::Int32:   return "int32";
        case ColumnType::Int64:   return "int64";
        case ColumnType::Float64: return "float64";
        case ColumnType::String:  return "string";
    }
    return "unknown";
}

ColumnType parse_column_type(std::string_view s)
{
    if (s == "int16")   return ColumnType::Int16;
    if (s == "int32")   return ColumnType::Int32;
    if (s == "int64")   return ColumnType::Int64;
    if (s == "float64") return ColumnType::Float64;
    if (s == "string")  return ColumnType::String;
    throw std::invalid_argument("unknown column type '" + std::string(s) + "'");
}

SchemaRegistry::SchemaRegistry()
{
    for (auto kind : kAllDatasetKinds) {
        auto& slot = specs_[static_cast<std::size_t>(kind)];
        switch (kind) {
            case DatasetKind::StockQuote:  slot = kQuote; break;
            case DatasetKind::StockEod:    slot = kEod; break;
            case DatasetKind::OptionQuote: slot = concat(kContract, kQuote); break;
            case DatasetKind::OptionEod:   slot = concat(kContract, kEod); break;
            case DatasetKind::Earnings:    slot = kEarnings; break;
        }
    }
}

std::vector<std::string> SchemaRegistry::column_names(DatasetKind kind) const
{
    std::vector<std::string> names;
    for (const auto& f : spec(kind)) {
        names.push_back(f.name);
    }
    return names;
}
