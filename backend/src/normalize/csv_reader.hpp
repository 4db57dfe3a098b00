#pragma once
#include <string_view>
#include <vector>

#include "schema/schema_registry.hpp"

// Views into a provider CSV body. The body must outlive the document.
struct CsvDocument {
    std::vector<std::string_view> header;
    std::vector<std::vector<std::string_view>> rows;
};

// Splits on '\n' and ','. Tolerates "\r\n" and skips blank lines. Double-quoted
// cells lose their quotes; quoted commas are not supported by the provider format.
CsvDocument parse_csv(std::string_view body);

// Throws SchemaMismatchError unless the header equals `spec`'s column names in order
// and every row has exactly that many cells.
void expect_columns(const CsvDocument& doc, const ColumnSpec& spec, DatasetKind kind);
