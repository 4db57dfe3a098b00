#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "lake/dataset_kind.hpp"

enum class ColumnType : std::uint8_t { Int16, Int32, Int64, Float64, String };

const char* to_cstr(ColumnType t);
// Throws std::invalid_argument for unknown type names.
ColumnType parse_column_type(std::string_view s);

struct ColumnField {
    std::string name;
    ColumnType type;

    bool operator==(const ColumnField&) const = default;
};

using ColumnSpec = std::vector<ColumnField>;

// Static DatasetKind -> ColumnSpec mapping. The single source of truth for both the
// normalizers (write path) and the table codec (read path).
class SchemaRegistry {
public:
    static const SchemaRegistry& instance() {
        static SchemaRegistry registry;
        return registry;
    }

    const ColumnSpec& spec(DatasetKind kind) const { return specs_[static_cast<std::size_t>(kind)]; }

    // Column names in order, as they appear in a provider CSV header.
    std::vector<std::string> column_names(DatasetKind kind) const;

private:
    SchemaRegistry();

    std::array<ColumnSpec, kDatasetKindCount> specs_;
};
