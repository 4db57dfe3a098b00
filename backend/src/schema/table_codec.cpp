#include "table_codec.hpp"
#include "lake/errors.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace
{
    template <typename ColT>
    json column_to_json(const ColT& col)
    {
        json arr = json::array();
        for (const auto& cell : col) {
            if (cell) arr.push_back(*cell);
            else      arr.push_back(nullptr);
        }
        return arr;
    }

    std::string describe(const ColumnSpec& spec)
    {
        std::string out;
        for (const auto& f : spec) {
            if (!out.empty()) out += ", ";
            out += f.name + ":" + to_cstr(f.type);
        }
        return out;
    }
}

Bytes TableCodec::encode(const CanonicalTable& table)
{
    json schema = json::array();
    for (const auto& f : table.schema()) {
        schema.push_back({{"name", f.name}, {"type", to_cstr(f.type)}});
    }

    json columns = json::array();
    for (std::size_t i = 0; i < table.num_columns(); ++i) {
        columns.push_back(std::visit([](const auto& c) { return column_to_json(c); }, table.column(i)));
    }

    json obj = {
        {"dataset", to_cstr(table.kind())},
        {"rows", table.num_rows()},
        {"schema", std::move(schema)},
        {"columns", std::move(columns)},
    };
    return json::to_msgpack(obj);
}

CanonicalTable TableCodec::decode(const Bytes& bytes, DatasetKind expected)
{
    json obj;
    try {
        obj = json::from_msgpack(bytes);
    } catch (const json::exception& e) {
        throw SchemaMismatchError(std::string("undecodable partition object: ") + e.what());
    }

    try {
        const auto dataset = obj.at("dataset").get<std::string>();
        if (dataset != to_cstr(expected)) {
            throw SchemaMismatchError("partition holds '" + dataset + "', expected '" + to_cstr(expected) + "'");
        }

        ColumnSpec stored;
        for (const auto& f : obj.at("schema")) {
            stored.push_back(ColumnField{f.at("name").get<std::string>(),
                                         parse_column_type(f.at("type").get<std::string>())});
        }
        const auto& registered = SchemaRegistry::instance().spec(expected);
        if (stored != registered) {
            throw SchemaMismatchError("stored schema drifted for " + dataset + ": [" + describe(stored) +
                                      "] vs registry [" + describe(registered) + "]");
        }

        const auto& columns = obj.at("columns");
        const auto rows = obj.at("rows").get<std::size_t>();
        if (!columns.is_array() || columns.size() != registered.size()) {
            throw SchemaMismatchError("column count does not match the stored schema");
        }
        for (const auto& c : columns) {
            if (!c.is_array() || c.size() != rows) {
                throw SchemaMismatchError("column length does not match the stored row count");
            }
        }

        TableBuilder builder(expected);
        for (std::size_t r = 0; r < rows; ++r) {
            for (std::size_t i = 0; i < registered.size(); ++i) {
                const auto& cell = columns[i][r];
                if (cell.is_null()) {
                    builder.append_null(i);
                    continue;
                }
                switch (registered[i].type) {
                    case ColumnType::Int16:
                    case ColumnType::Int32:
                    case ColumnType::Int64:
                        if (!cell.is_number_integer()) throw SchemaMismatchError("non-integer cell in " + registered[i].name);
                        builder.append_int(i, cell.get<std::int64_t>());
                        break;
                    case ColumnType::Float64:
                        if (!cell.is_number()) throw SchemaMismatchError("non-numeric cell in " + registered[i].name);
                        builder.append_double(i, cell.get<double>());
                        break;
                    case ColumnType::String:
                        if (!cell.is_string()) throw SchemaMismatchError("non-string cell in " + registered[i].name);
                        builder.append_string(i, cell.get<std::string>());
                        break;
                }
            }
            builder.end_row();
        }
        return std::move(builder).finish();
    } catch (const json::exception& e) {
        throw SchemaMismatchError(std::string("malformed partition object: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw SchemaMismatchError(std::string("malformed partition object: ") + e.what());
    }
}
