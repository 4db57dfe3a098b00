#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "schema_registry.hpp"

// One typed vector per column; std::nullopt is a null cell.
using Int16Column   = std::vector<std::optional<std::int16_t>>;
using Int32Column   = std::vector<std::optional<std::int32_t>>;
using Int64Column   = std::vector<std::optional<std::int64_t>>;
using Float64Column = std::vector<std::optional<double>>;
using StringColumn  = std::vector<std::optional<std::string>>;

using ColumnData = std::variant<Int16Column, Int32Column, Int64Column, Float64Column, StringColumn>;

ColumnData make_column(ColumnType t);
std::size_t column_size(const ColumnData& c);

// Columnar table whose schema is exactly the registry entry for its kind.
// Produced by TableBuilder, immutable afterwards; shared as shared_ptr<const CanonicalTable>.
class CanonicalTable {
public:
    // Zero-row table with the registry schema for `kind`.
    explicit CanonicalTable(DatasetKind kind);

    DatasetKind kind() const noexcept { return kind_; }
    const ColumnSpec& schema() const { return SchemaRegistry::instance().spec(kind_); }

    std::size_t num_columns() const noexcept { return columns_.size(); }
    std::size_t num_rows() const noexcept { return rows_; }
    bool empty() const noexcept { return rows_ == 0; }

    const ColumnData& column(std::size_t i) const { return columns_.at(i); }
    // Throws std::out_of_range for an unknown column name.
    const ColumnData& column(std::string_view name) const;

    template <typename ColumnT>
    const ColumnT& column_as(std::string_view name) const { return std::get<ColumnT>(column(name)); }

    // Union of same-kind tables in the given order. Throws SchemaMismatchError on a kind mismatch.
    static CanonicalTable concat(DatasetKind kind,
                                 const std::vector<std::shared_ptr<const CanonicalTable>>& parts);

    bool operator==(const CanonicalTable&) const = default;

private:
    friend class TableBuilder;

    DatasetKind kind_;
    std::vector<ColumnData> columns_;
    std::size_t rows_{0};
};

// Row-wise builder with strict per-type parsing. Every cell of a row must be appended
// before end_row(); conversion failures throw SchemaMismatchError.
class TableBuilder {
public:
    explicit TableBuilder(DatasetKind kind);

    // Empty text is null. Otherwise the whole text must parse as the column's type.
    void append_text(std::size_t col, std::string_view text);

    void append_null(std::size_t col);
    void append_int(std::size_t col, std::int64_t v);      // integer columns only, range checked
    void append_double(std::size_t col, double v);         // float64 columns only
    void append_string(std::size_t col, std::string v);    // string columns only

    // Convenience: one text cell per column, in schema order.
    void append_text_row(const std::vector<std::string_view>& cells);

    void end_row();

    std::size_t num_rows() const noexcept { return table_.rows_; }
    CanonicalTable finish() &&;

private:
    ColumnData& slot(std::size_t col);
    [[noreturn]] void mismatch(std::size_t col, std::string_view what) const;

    CanonicalTable table_;
};
