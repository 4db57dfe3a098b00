#include "request_json.hpp"

#include <stdexcept>

namespace
{
    std::int64_t int_field(const json& j, const char* key)
    {
        const auto& v = j.at(key);
        if (v.is_number_integer()) return v.get<std::int64_t>();
        if (v.is_string()) {
            const auto s = v.get<std::string>();
            std::size_t used = 0;
            long long n = 0;
            try {
                n = std::stoll(s, &used);
            } catch (const std::logic_error&) {
                used = 0;
            }
            if (used == s.size() && !s.empty()) return n;
        }
        throw std::invalid_argument(std::string("'") + key + "' must be an integer");
    }

    // 20240131, "20240131" or "2024-01-31"
    Date date_field(const json& j, const char* key)
    {
        const auto& v = j.at(key);
        if (v.is_string()) {
            auto s = v.get<std::string>();
            if (s.size() == 10 && s[4] == '-' && s[7] == '-') {
                s = s.substr(0, 4) + s.substr(5, 2) + s.substr(8, 2);
                return Date::from_int(std::stoll(s));
            }
        }
        return Date::from_int(int_field(j, key));
    }

    template <typename ColT>
    json values_to_json(const ColT& col)
    {
        json arr = json::array();
        for (const auto& cell : col) {
            if (cell) arr.push_back(*cell);
            else      arr.push_back(nullptr);
        }
        return arr;
    }
}

LogicalRequest request_from_json(const json& j)
{
    if (!j.is_object()) throw std::invalid_argument("request body must be a JSON object");
    if (!j.contains("kind")) throw std::invalid_argument("'kind' is required");

    LogicalRequest r;
    r.kind = parse_dataset_kind(j.at("kind").get<std::string>());
    if (j.contains("symbol")) r.symbol = j.at("symbol").get<std::string>();

    if (j.contains("start")) r.start = date_field(j, "start");
    if (j.contains("end"))   r.end = date_field(j, "end");
    if (j.contains("start_yearmo")) {
        r.start = YearMonth::from_int(int_field(j, "start_yearmo")).first_day();
        const auto end_ym = j.contains("end_yearmo") ? int_field(j, "end_yearmo") : int_field(j, "start_yearmo");
        r.end = YearMonth::from_int(end_ym).last_day();
    }

    if (j.contains("all"))           r.all = j.at("all").get<bool>();
    if (j.contains("interval_ms"))   r.interval_ms = int_field(j, "interval_ms");
    if (j.contains("expiration"))    r.expiration = static_cast<std::int32_t>(int_field(j, "expiration"));
    if (j.contains("granularity"))   r.granularity = parse_granularity(j.at("granularity").get<std::string>());
    if (j.contains("force_refresh")) r.force_refresh = j.at("force_refresh").get<bool>();
    return r;
}

json snapshot_to_json(const JobSnapshot& s)
{
    return {
        {"completed", s.completed},
        {"total", s.total},
        {"state", to_cstr(s.state)},
    };
}

json report_to_json(const JobReport& r)
{
    json failed = json::array();
    for (const auto& f : r.failed_slots) {
        failed.push_back({{"slot", f.slot}, {"url", f.url}, {"reason", f.reason}});
    }
    json out = {
        {"id", r.id},
        {"state", to_cstr(r.state)},
        {"completed", r.completed},
        {"total", r.total},
        {"committed", r.committed},
        {"rows_written", r.rows_written},
        {"failed_slots", std::move(failed)},
        {"written_keys", r.written_keys},
        {"unwritten_keys", r.unwritten_keys},
        {"skipped_keys", r.skipped_keys},
    };
    out["commit_error"] = r.commit_error ? json(*r.commit_error) : json(nullptr);
    return out;
}

json table_to_json(const CanonicalTable& t)
{
    json columns = json::array();
    const auto& spec = t.schema();
    for (std::size_t i = 0; i < spec.size(); ++i) {
        columns.push_back({
            {"name", spec[i].name},
            {"type", to_cstr(spec[i].type)},
            {"values", std::visit([](const auto& c) { return values_to_json(c); }, t.column(i))},
        });
    }
    return {
        {"dataset", to_cstr(t.kind())},
        {"rows", t.num_rows()},
        {"columns", std::move(columns)},
    };
}
