#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

enum class DatasetKind : std::uint8_t {
    OptionQuote = 0,
    OptionEod   = 1,
    StockQuote  = 2,
    StockEod    = 3,
    Earnings    = 4,
};

inline constexpr std::size_t kDatasetKindCount = 5;

inline constexpr std::array<DatasetKind, kDatasetKindCount> kAllDatasetKinds{
    DatasetKind::OptionQuote, DatasetKind::OptionEod,
    DatasetKind::StockQuote,  DatasetKind::StockEod,
    DatasetKind::Earnings,
};

// Wire/storage name: "option_quote", "option_eod", ...
const char* to_cstr(DatasetKind k);

// Throws std::invalid_argument for unknown names.
DatasetKind parse_dataset_kind(std::string_view name);

inline bool is_option(DatasetKind k) { return k == DatasetKind::OptionQuote || k == DatasetKind::OptionEod; }
inline bool is_stock(DatasetKind k)  { return k == DatasetKind::StockQuote || k == DatasetKind::StockEod; }
inline bool is_eod(DatasetKind k)    { return k == DatasetKind::OptionEod || k == DatasetKind::StockEod; }

// Kinds served by the local provider terminal (everything but earnings).
inline bool needs_provider(DatasetKind k) { return k != DatasetKind::Earnings; }

// "quote" | "eod" for provider-backed kinds, "" for earnings.
std::string endpoint_of(DatasetKind k);

// The stock kind with the same endpoint (OptionEod -> StockEod). Identity for stock kinds.
DatasetKind underlying_kind(DatasetKind k);
