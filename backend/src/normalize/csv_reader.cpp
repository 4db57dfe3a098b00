#include "csv_reader.hpp"
#include "lake/errors.hpp"

#include <string>

namespace
{
    std::string_view unquote(std::string_view cell)
    {
        if (cell.size() >= 2 && cell.front() == '"' && cell.back() == '"') {
            return cell.substr(1, cell.size() - 2);
        }
        return cell;
    }

    std::vector<std::string_view> split_line(std::string_view line)
    {
        std::vector<std::string_view> cells;
        std::size_t pos = 0;
        while (true) {
            auto comma = line.find(',', pos);
            if (comma == std::string_view::npos) {
                cells.push_back(unquote(line.substr(pos)));
                break;
            }
            cells.push_back(unquote(line.substr(pos, comma - pos)));
            pos = comma + 1;
        }
        return cells;
    }

    std::string join(const std::vector<std::string_view>& parts)
    {
        std::string out;
        for (auto p : parts) {
            if (!out.empty()) out += ',';
            out += p;
        }
        return out;
    }
}

CsvDocument parse_csv(std::string_view body)
{
    CsvDocument doc;
    bool have_header = false;
    std::size_t pos = 0;
    while (pos < body.size()) {
        auto nl = body.find('\n', pos);
        auto line = body.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
        pos = nl == std::string_view::npos ? body.size() : nl + 1;

        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (line.empty()) continue;

        if (!have_header) {
            doc.header = split_line(line);
            have_header = true;
        } else {
            doc.rows.push_back(split_line(line));
        }
    }
    return doc;
}

void expect_columns(const CsvDocument& doc, const ColumnSpec& spec, DatasetKind kind)
{
    bool same = doc.header.size() == spec.size();
    for (std::size_t i = 0; same && i < spec.size(); ++i) {
        same = doc.header[i] == spec[i].name;
    }
    if (!same) {
        std::vector<std::string_view> expected;
        for (const auto& f : spec) expected.push_back(f.name);
        throw SchemaMismatchError(std::string(to_cstr(kind)) + " header mismatch: got [" + join(doc.header) +
                                  "], expected [" + join(expected) + "]");
    }
    for (std::size_t r = 0; r < doc.rows.size(); ++r) {
        if (doc.rows[r].size() != spec.size()) {
            throw SchemaMismatchError(std::string(to_cstr(kind)) + " row " + std::to_string(r) + " has " +
                                      std::to_string(doc.rows[r].size()) + " cells, expected " +
                                      std::to_string(spec.size()));
        }
    }
}
