#include "canonical_table.hpp"
#include "lake/errors.hpp"

#include <charconv>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace
{
    template <typename IntT>
    std::optional<IntT> parse_integer(std::string_view sv)
    {
        IntT v{};
        auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
        if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
        return v;
    }

    // Plain decimal or exponent notation only: no whitespace, hex, inf or nan.
    std::optional<double> parse_float(std::string_view sv)
    {
        double v{};
        auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v, std::chars_format::general);
        if (ec != std::errc{} || ptr != sv.data() + sv.size() || !std::isfinite(v)) return std::nullopt;
        return v;
    }

    template <typename IntT>
    bool fits(std::int64_t v)
    {
        return v >= std::numeric_limits<IntT>::min() && v <= std::numeric_limits<IntT>::max();
    }
}

ColumnData make_column(ColumnType t)
{
    switch (t) {
        case ColumnType::Int16:   return Int16Column{};
        case ColumnType::Int32:   return Int32Column{};
        case ColumnType::Int64:   return Int64Column{};
        case ColumnType::Float64: return Float64Column{};
        case ColumnType::String:  return StringColumn{};
    }
    throw std::invalid_argument("unknown column type");
}

std::size_t column_size(const ColumnData& c)
{
    return std::visit([](const auto& v) { return v.size(); }, c);
}

CanonicalTable::CanonicalTable(DatasetKind kind) : kind_(kind)
{
    const auto& spec = SchemaRegistry::instance().spec(kind);
    columns_.reserve(spec.size());
    for (const auto& f : spec) {
        columns_.push_back(make_column(f.type));
    }
}

const ColumnData& CanonicalTable::column(std::string_view name) const
{
    const auto& spec = schema();
    for (std::size_t i = 0; i < spec.size(); ++i) {
        if (spec[i].name == name) return columns_[i];
    }
    throw std::out_of_range("no column named '" + std::string(name) + "' in " + to_cstr(kind_));
}

CanonicalTable CanonicalTable::concat(DatasetKind kind,
                                      const std::vector<std::shared_ptr<const CanonicalTable>>& parts)
{
    CanonicalTable out(kind);
    for (const auto& part : parts) {
        if (!part) continue;
        if (part->kind_ != kind) {
            throw SchemaMismatchError(std::string("cannot union ") + to_cstr(part->kind_) +
                                      " table into " + to_cstr(kind));
        }
        for (std::size_t i = 0; i < out.columns_.size(); ++i) {
            std::visit([&](auto& dst) {
                using ColT = std::decay_t<decltype(dst)>;
                const auto& src = std::get<ColT>(part->columns_[i]);
                dst.insert(dst.end(), src.begin(), src.end());
            }, out.columns_[i]);
        }
        out.rows_ += part->rows_;
    }
    return out;
}

TableBuilder::TableBuilder(DatasetKind kind) : table_(kind) {}

ColumnData& TableBuilder::slot(std::size_t col)
{
    if (col >= table_.columns_.size()) {
        throw SchemaMismatchError("column index " + std::to_string(col) + " out of range for " +
                                  to_cstr(table_.kind_));
    }
    if (column_size(table_.columns_[col]) != table_.rows_) {
        mismatch(col, "cell appended twice in one row");
    }
    return table_.columns_[col];
}

void TableBuilder::mismatch(std::size_t col, std::string_view what) const
{
    const auto& spec = table_.schema();
    const std::string name = col < spec.size() ? spec[col].name : std::to_string(col);
    const std::string type = col < spec.size() ? to_cstr(spec[col].type) : "?";
    throw SchemaMismatchError(std::string(to_cstr(table_.kind_)) + " row " + std::to_string(table_.rows_) +
                              ", column '" + name + "' (" + type + "): " + std::string(what));
}

void TableBuilder::append_text(std::size_t col, std::string_view text)
{
    if (text.empty()) {
        append_null(col);
        return;
    }
    auto& c = slot(col);
    std::visit([&](auto& v) {
        using ColT = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<ColT, StringColumn>) {
            v.emplace_back(std::string(text));
        } else if constexpr (std::is_same_v<ColT, Float64Column>) {
            auto d = parse_float(text);
            if (!d) mismatch(col, "'" + std::string(text) + "' is not a float64");
            v.emplace_back(*d);
        } else {
            using IntT = typename ColT::value_type::value_type;
            auto i = parse_integer<IntT>(text);
            if (!i) mismatch(col, "'" + std::string(text) + "' is not a " + to_cstr(table_.schema()[col].type));
            v.emplace_back(*i);
        }
    }, c);
}

void TableBuilder::append_null(std::size_t col)
{
    std::visit([](auto& v) { v.emplace_back(std::nullopt); }, slot(col));
}

void TableBuilder::append_int(std::size_t col, std::int64_t value)
{
    auto& c = slot(col);
    std::visit([&](auto& v) {
        using ColT = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<ColT, StringColumn> || std::is_same_v<ColT, Float64Column>) {
            mismatch(col, "integer value for a non-integer column");
        } else {
            using IntT = typename ColT::value_type::value_type;
            if (!fits<IntT>(value)) mismatch(col, std::to_string(value) + " out of range");
            v.emplace_back(static_cast<IntT>(value));
        }
    }, c);
}

void TableBuilder::append_double(std::size_t col, double value)
{
    auto& c = slot(col);
    auto* v = std::get_if<Float64Column>(&c);
    if (!v) mismatch(col, "float64 value for a non-float64 column");
    v->emplace_back(value);
}

void TableBuilder::append_string(std::size_t col, std::string value)
{
    auto& c = slot(col);
    auto* v = std::get_if<StringColumn>(&c);
    if (!v) mismatch(col, "string value for a non-string column");
    v->emplace_back(std::move(value));
}

void TableBuilder::append_text_row(const std::vector<std::string_view>& cells)
{
    if (cells.size() != table_.columns_.size()) {
        throw SchemaMismatchError(std::string(to_cstr(table_.kind_)) + " row " + std::to_string(table_.rows_) +
                                  " has " + std::to_string(cells.size()) + " cells, expected " +
                                  std::to_string(table_.columns_.size()));
    }
    for (std::size_t i = 0; i < cells.size(); ++i) {
        append_text(i, cells[i]);
    }
    end_row();
}

void TableBuilder::end_row()
{
    for (std::size_t i = 0; i < table_.columns_.size(); ++i) {
        if (column_size(table_.columns_[i]) != table_.rows_ + 1) {
            mismatch(i, "row ended without a value for this column");
        }
    }
    ++table_.rows_;
}

CanonicalTable TableBuilder::finish() &&
{
    for (std::size_t i = 0; i < table_.columns_.size(); ++i) {
        if (column_size(table_.columns_[i]) != table_.rows_) {
            mismatch(i, "unfinished row");
        }
    }
    return std::move(table_);
}
