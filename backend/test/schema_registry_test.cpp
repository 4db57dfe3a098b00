#include "schema/schema_registry.hpp"

#include <stdexcept>
#include <gtest/gtest.h>

class schema_registry_test : public ::testing::Test {
};

TEST_F(schema_registry_test, stock_quote_columns) {
    std::vector<std::string> expected{
        "ms_of_day", "bid_size", "bid_exchange", "bid", "bid_condition",
        "ask_size", "ask_exchange", "ask", "ask_condition", "date",
    };
    EXPECT_EQ(expected, SchemaRegistry::instance().column_names(DatasetKind::StockQuote));
}

TEST_F(schema_registry_test, option_specs_prefix_contract_columns) {
    const auto& reg = SchemaRegistry::instance();
    for (auto kind : {DatasetKind::OptionQuote, DatasetKind::OptionEod}) {
        const auto& opt = reg.spec(kind);
        const auto& stock = reg.spec(underlying_kind(kind));
        ASSERT_EQ(stock.size() + 4, opt.size());
        EXPECT_EQ((ColumnField{"root", ColumnType::String}), opt[0]);
        EXPECT_EQ((ColumnField{"expiration", ColumnType::Int32}), opt[1]);
        EXPECT_EQ((ColumnField{"strike", ColumnType::Int64}), opt[2]);
        EXPECT_EQ((ColumnField{"right", ColumnType::String}), opt[3]);
        for (std::size_t i = 0; i < stock.size(); ++i) {
            EXPECT_EQ(stock[i], opt[i + 4]);
        }
    }
}

TEST_F(schema_registry_test, sizes) {
    const auto& reg = SchemaRegistry::instance();
    EXPECT_EQ(10, reg.spec(DatasetKind::StockQuote).size());
    EXPECT_EQ(17, reg.spec(DatasetKind::StockEod).size());
    EXPECT_EQ(14, reg.spec(DatasetKind::OptionQuote).size());
    EXPECT_EQ(21, reg.spec(DatasetKind::OptionEod).size());
    EXPECT_EQ(10, reg.spec(DatasetKind::Earnings).size());
}

TEST_F(schema_registry_test, earnings_types) {
    const auto& spec = SchemaRegistry::instance().spec(DatasetKind::Earnings);
    EXPECT_EQ((ColumnField{"date", ColumnType::String}), spec.front());
    EXPECT_EQ((ColumnField{"market_cap", ColumnType::Int64}), spec[7]);
    EXPECT_EQ((ColumnField{"num_estimates", ColumnType::Int64}), spec.back());
}

TEST_F(schema_registry_test, column_type_names) {
    for (auto t : {ColumnType::Int16, ColumnType::Int32, ColumnType::Int64, ColumnType::Float64, ColumnType::String}) {
        EXPECT_EQ(t, parse_column_type(to_cstr(t)));
    }
    EXPECT_THROW(parse_column_type("decimal"), std::invalid_argument);
}

TEST_F(schema_registry_test, dataset_kind_names) {
    for (auto k : kAllDatasetKinds) {
        EXPECT_EQ(k, parse_dataset_kind(to_cstr(k)));
    }
    EXPECT_THROW(parse_dataset_kind("option_trade"), std::invalid_argument);
    EXPECT_EQ("eod", endpoint_of(DatasetKind::OptionEod));
    EXPECT_EQ(DatasetKind::StockQuote, underlying_kind(DatasetKind::OptionQuote));
}
