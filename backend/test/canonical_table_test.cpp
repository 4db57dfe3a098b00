#include "schema/canonical_table.hpp"
#include "schema/table_codec.hpp"
#include "lake/errors.hpp"

#include <nlohmann/json.hpp>
#include <gtest/gtest.h>

class canonical_table_test : public ::testing::Test {
public:
    static CanonicalTable quote_rows(std::vector<std::vector<std::string_view>> rows) {
        TableBuilder b(DatasetKind::StockQuote);
        for (const auto& r : rows) {
            b.append_text_row(r);
        }
        return std::move(b).finish();
    }
};

TEST_F(canonical_table_test, empty_table_has_schema) {
    CanonicalTable t(DatasetKind::OptionEod);
    EXPECT_TRUE(t.empty());
    EXPECT_EQ(0, t.num_rows());
    EXPECT_EQ(21, t.num_columns());
    EXPECT_EQ(&SchemaRegistry::instance().spec(DatasetKind::OptionEod), &t.schema());
}

TEST_F(canonical_table_test, typed_columns) {
    auto t = quote_rows({
        {"34200000", "10", "1", "470.5", "0", "12", "2", "470.75", "0", "20240102"},
        {"37800000", "", "1", "", "0", "12", "2", "471", "0", "20240102"},
    });
    ASSERT_EQ(2, t.num_rows());
    const auto& ms = t.column_as<Int64Column>("ms_of_day");
    EXPECT_EQ(37800000, *ms[1]);
    const auto& bid = t.column_as<Float64Column>("bid");
    EXPECT_DOUBLE_EQ(470.5, *bid[0]);
    EXPECT_FALSE(bid[1].has_value());
    EXPECT_FALSE(t.column_as<Int32Column>("bid_size")[1].has_value());
    EXPECT_EQ(20240102, *t.column_as<Int32Column>("date")[0]);
    EXPECT_THROW(t.column("volume"), std::out_of_range);
}

TEST_F(canonical_table_test, strict_cell_parsing) {
    TableBuilder b(DatasetKind::StockQuote);
    EXPECT_THROW(b.append_text_row({"34200000", "ten", "1", "470.5", "0", "12", "2", "470.75", "0", "20240102"}),
                 SchemaMismatchError);

    TableBuilder c(DatasetKind::StockQuote);
    EXPECT_THROW(c.append_text_row({"34200000", "10", "1", "470.5x", "0", "12", "2", "470.75", "0", "20240102"}),
                 SchemaMismatchError);

    // bid_exchange is int16
    TableBuilder d(DatasetKind::StockQuote);
    EXPECT_THROW(d.append_text_row({"34200000", "10", "40000", "470.5", "0", "12", "2", "470.75", "0", "20240102"}),
                 SchemaMismatchError);

    // decimals are not truncated into integer columns
    TableBuilder e(DatasetKind::StockQuote);
    EXPECT_THROW(e.append_text_row({"34200000.5", "10", "1", "470.5", "0", "12", "2", "470.75", "0", "20240102"}),
                 SchemaMismatchError);
}

TEST_F(canonical_table_test, float_cells_parse_strictly) {
    for (const char* cell : {" 470.5", "470.5 ", "0x1p3", "inf", "-inf", "nan", "NaN", "1e400", "+470.5", "470,5"}) {
        TableBuilder b(DatasetKind::StockQuote);
        EXPECT_THROW(b.append_text_row({"34200000", "10", "1", cell, "0", "12", "2", "470.75", "0", "20240102"}),
                     SchemaMismatchError) << "cell '" << cell << "'";
    }

    auto t = quote_rows({{"34200000", "10", "1", "4.705e2", "0", "12", "2", "-0.25", "0", "20240102"}});
    EXPECT_DOUBLE_EQ(470.5, *t.column_as<Float64Column>("bid")[0]);
    EXPECT_DOUBLE_EQ(-0.25, *t.column_as<Float64Column>("ask")[0]);
}

TEST_F(canonical_table_test, row_shape_checked) {
    TableBuilder b(DatasetKind::StockQuote);
    EXPECT_THROW(b.append_text_row({"34200000", "10"}), SchemaMismatchError);

    TableBuilder c(DatasetKind::StockQuote);
    c.append_int(0, 1);
    EXPECT_THROW(c.end_row(), SchemaMismatchError);

    TableBuilder d(DatasetKind::StockQuote);
    d.append_int(0, 1);
    EXPECT_THROW(d.append_int(0, 2), SchemaMismatchError);

    TableBuilder e(DatasetKind::Earnings);
    EXPECT_THROW(e.append_int(0, 1), SchemaMismatchError);   // date is a string column
    EXPECT_THROW(e.append_double(1, 1.0), SchemaMismatchError);
}

TEST_F(canonical_table_test, concat_keeps_part_order) {
    auto a = std::make_shared<const CanonicalTable>(
        quote_rows({{"1", "1", "1", "1", "0", "1", "1", "1", "0", "20240102"}}));
    auto b = std::make_shared<const CanonicalTable>(quote_rows({
        {"2", "1", "1", "1", "0", "1", "1", "1", "0", "20240103"},
        {"3", "1", "1", "1", "0", "1", "1", "1", "0", "20240103"},
    }));
    auto empty = std::make_shared<const CanonicalTable>(DatasetKind::StockQuote);

    auto t = CanonicalTable::concat(DatasetKind::StockQuote, {b, empty, a});
    ASSERT_EQ(3, t.num_rows());
    const auto& ms = t.column_as<Int64Column>("ms_of_day");
    EXPECT_EQ(2, *ms[0]);
    EXPECT_EQ(3, *ms[1]);
    EXPECT_EQ(1, *ms[2]);

    auto other = std::make_shared<const CanonicalTable>(DatasetKind::StockEod);
    EXPECT_THROW(CanonicalTable::concat(DatasetKind::StockQuote, {a, other}), SchemaMismatchError);
}

TEST_F(canonical_table_test, codec_preserves_nulls_and_types) {
    auto t = quote_rows({
        {"34200000", "10", "1", "470.5", "0", "12", "2", "470.75", "0", "20240102"},
        {"37800000", "", "", "", "", "", "", "", "", "20240102"},
    });
    auto decoded = TableCodec::decode(TableCodec::encode(t), DatasetKind::StockQuote);
    EXPECT_EQ(t, decoded);

    CanonicalTable empty(DatasetKind::Earnings);
    EXPECT_EQ(empty, TableCodec::decode(TableCodec::encode(empty), DatasetKind::Earnings));
}

TEST_F(canonical_table_test, codec_rejects_other_dataset) {
    auto bytes = TableCodec::encode(CanonicalTable(DatasetKind::StockQuote));
    EXPECT_THROW(TableCodec::decode(bytes, DatasetKind::StockEod), SchemaMismatchError);
}

TEST_F(canonical_table_test, codec_rejects_schema_drift) {
    auto obj = nlohmann::json::from_msgpack(TableCodec::encode(CanonicalTable(DatasetKind::StockQuote)));
    obj["schema"][3]["type"] = "string";
    EXPECT_THROW(TableCodec::decode(nlohmann::json::to_msgpack(obj), DatasetKind::StockQuote), SchemaMismatchError);

    auto renamed = nlohmann::json::from_msgpack(TableCodec::encode(CanonicalTable(DatasetKind::StockQuote)));
    renamed["schema"][0]["name"] = "ms";
    EXPECT_THROW(TableCodec::decode(nlohmann::json::to_msgpack(renamed), DatasetKind::StockQuote), SchemaMismatchError);
}

TEST_F(canonical_table_test, codec_rejects_garbage) {
    Bytes junk{0xc1, 0x00, 0x17};
    EXPECT_THROW(TableCodec::decode(junk, DatasetKind::StockQuote), SchemaMismatchError);

    auto obj = nlohmann::json::from_msgpack(TableCodec::encode(CanonicalTable(DatasetKind::StockQuote)));
    obj["rows"] = 1;
    EXPECT_THROW(TableCodec::decode(nlohmann::json::to_msgpack(obj), DatasetKind::StockQuote), SchemaMismatchError);
}
