#include "normalizer.hpp"
#include "lake/calendar.hpp"
#include "lake/errors.hpp"
#include "util/log.hpp"

#include <simdjson.h>

#include <array>
#include <charconv>
#include <cmath>
#include <optional>
#include <string>

namespace
{
    enum EarningsColumn : std::size_t {
        kDate = 0, kSymbol, kName, kTime, kEps, kEpsForecast, kSurprise, kMarketCap, kFiscalQuarter, kNumEstimates,
    };

    std::string_view trim(std::string_view s)
    {
        while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
        while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\n' || s.back() == '\r')) s.remove_suffix(1);
        return s;
    }

    bool is_blank(std::string_view s) { return s.empty() || s == "N/A"; }

    std::optional<double> strict_double(std::string_view s)
    {
        if (!s.empty() && s.front() == '+') s.remove_prefix(1);
        double v{};
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v, std::chars_format::general);
        if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size() || !std::isfinite(v)) return std::nullopt;
        return v;
    }

    std::string strip_chars(std::string_view s, std::string_view drop)
    {
        std::string out;
        for (char c : s) {
            if (drop.find(c) == std::string_view::npos) out.push_back(c);
        }
        return out;
    }

    // "Mon, Sep 29, 2025" -> "2025-09-29"
    std::string as_of_to_iso(std::string_view s)
    {
        static constexpr std::array<std::string_view, 12> kMonths{
            "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

        auto bad = [&]() { return SchemaMismatchError("unparseable asOf date '" + std::string(s) + "'"); };

        auto comma = s.find(", ");
        if (comma == std::string_view::npos) throw bad();
        auto rest = s.substr(comma + 2);               // "Sep 29, 2025"
        if (rest.size() < 3) throw bad();

        int month = 0;
        for (std::size_t i = 0; i < kMonths.size(); ++i) {
            if (rest.substr(0, 3) == kMonths[i]) month = static_cast<int>(i) + 1;
        }
        if (month == 0) throw bad();

        rest = trim(rest.substr(3));
        auto comma2 = rest.find(',');
        if (comma2 == std::string_view::npos) throw bad();
        auto day_sv = trim(rest.substr(0, comma2));
        auto year_sv = trim(rest.substr(comma2 + 1));

        int day = 0, year = 0;
        auto r1 = std::from_chars(day_sv.data(), day_sv.data() + day_sv.size(), day);
        auto r2 = std::from_chars(year_sv.data(), year_sv.data() + year_sv.size(), year);
        if (r1.ec != std::errc{} || r1.ptr != day_sv.data() + day_sv.size() ||
            r2.ec != std::errc{} || r2.ptr != year_sv.data() + year_sv.size()) {
            throw bad();
        }
        try {
            return Date::from_parts(year, month, day).dashed();
        } catch (const std::invalid_argument&) {
            throw bad();
        }
    }

    // Field text: strings unescaped, numbers as their raw token, null/missing as nullopt.
    std::optional<std::string> field_text(simdjson::ondemand::object& row, const char* key)
    {
        simdjson::ondemand::value v;
        if (row.find_field_unordered(key).get(v)) return std::nullopt;

        simdjson::ondemand::json_type t;
        if (v.type().get(t)) return std::nullopt;
        switch (t) {
            case simdjson::ondemand::json_type::null:
                return std::nullopt;
            case simdjson::ondemand::json_type::string: {
                std::string_view sv;
                if (v.get_string().get(sv)) return std::nullopt;
                return std::string(trim(sv));
            }
            case simdjson::ondemand::json_type::number:
                return std::string(trim(v.raw_json_token()));
            default:
                throw SchemaMismatchError(std::string("earnings field '") + key + "' is not a scalar");
        }
    }

    class EarningsRowWriter {
    public:
        explicit EarningsRowWriter(TableBuilder& b) : b_(b) {}

        void text(std::size_t col, const std::optional<std::string>& v, std::string_view null_token = {})
        {
            if (!v || v->empty() || (!null_token.empty() && *v == null_token)) b_.append_null(col);
            else b_.append_string(col, *v);
        }

        // "$0.56", "($2.55)", "N/A"
        void currency(std::size_t col, const std::optional<std::string>& v)
        {
            if (!v || is_blank(*v)) return b_.append_null(col);
            std::string cleaned = strip_chars(*v, "$,");
            if (cleaned.size() >= 2 && cleaned.front() == '(' && cleaned.back() == ')') {
                cleaned = "-" + cleaned.substr(1, cleaned.size() - 2);
            }
            number(col, cleaned, *v);
        }

        void percentage(std::size_t col, const std::optional<std::string>& v)
        {
            if (!v || is_blank(*v)) return b_.append_null(col);
            number(col, strip_chars(*v, "%"), *v);
        }

        // "$899,395,987"
        void market_cap(std::size_t col, const std::optional<std::string>& v)
        {
            if (!v || is_blank(*v)) return b_.append_null(col);
            auto d = strict_double(strip_chars(*v, "$,"));
            if (!d) throw SchemaMismatchError("unparseable market cap '" + *v + "'");
            b_.append_int(col, static_cast<std::int64_t>(*d));
        }

        void integer(std::size_t col, const std::optional<std::string>& v)
        {
            if (!v || is_blank(*v)) return b_.append_null(col);
            b_.append_text(col, *v);
        }

    private:
        void number(std::size_t col, const std::string& cleaned, const std::string& original)
        {
            auto d = strict_double(cleaned);
            if (!d) throw SchemaMismatchError("unparseable number '" + original + "'");
            b_.append_double(col, *d);
        }

        TableBuilder& b_;
    };

    struct EarningsNormalizer : INormalizer
    {
        CanonicalTable normalize(const RawPayload &payload, DatasetKind kind) const override
        {
            if (kind != DatasetKind::Earnings) {
                throw SchemaMismatchError(std::string("earnings normalizer cannot produce ") + to_cstr(kind));
            }

            simdjson::ondemand::parser parser;
            simdjson::padded_string pj(payload.body);
            simdjson::ondemand::document doc;
            if (auto err = parser.iterate(pj).get(doc)) {
                throw SchemaMismatchError(std::string("earnings payload is not JSON: ") + simdjson::error_message(err));
            }

            simdjson::ondemand::value data;
            if (auto err = doc["data"].get(data)) {
                throw SchemaMismatchError(std::string("earnings payload has no data field: ") + simdjson::error_message(err));
            }
            simdjson::ondemand::json_type data_type;
            if (data.type().get(data_type)) {
                throw SchemaMismatchError("earnings data field is unreadable");
            }
            if (data_type == simdjson::ondemand::json_type::null) {
                log_debug("normalize") << "earnings " << payload.source_url << ": data is null";
                return CanonicalTable(kind);
            }

            simdjson::ondemand::object obj;
            if (data.get_object().get(obj)) {
                throw SchemaMismatchError("earnings data field is not an object");
            }

            std::string_view as_of;
            if (auto err = obj.find_field_unordered("asOf").get_string().get(as_of)) {
                throw SchemaMismatchError(std::string("earnings payload has no asOf: ") + simdjson::error_message(err));
            }
            const std::string date = as_of_to_iso(as_of);

            TableBuilder builder(kind);
            simdjson::ondemand::value rows_value;
            if (obj.find_field_unordered("rows").get(rows_value)) {
                return std::move(builder).finish();
            }
            simdjson::ondemand::json_type rows_type;
            if (rows_value.type().get(rows_type) || rows_type == simdjson::ondemand::json_type::null) {
                return std::move(builder).finish();
            }
            simdjson::ondemand::array rows;
            if (rows_value.get_array().get(rows)) {
                throw SchemaMismatchError("earnings rows is not an array");
            }

            EarningsRowWriter w(builder);
            for (auto elem : rows) {
                simdjson::ondemand::object row;
                if (elem.get_object().get(row)) {
                    throw SchemaMismatchError("earnings row is not an object");
                }
                builder.append_string(kDate, date);
                w.text(kSymbol, field_text(row, "symbol"));
                w.text(kName, field_text(row, "name"));
                w.text(kTime, field_text(row, "time"), "time-not-supplied");
                w.currency(kEps, field_text(row, "eps"));
                w.currency(kEpsForecast, field_text(row, "epsForecast"));
                w.percentage(kSurprise, field_text(row, "surprise"));
                w.market_cap(kMarketCap, field_text(row, "marketCap"));
                w.text(kFiscalQuarter, field_text(row, "fiscalQuarterEnding"));
                w.integer(kNumEstimates, field_text(row, "noOfEsts"));
                builder.end_row();
            }
            log_debug("normalize") << "earnings " << date << ": " << builder.num_rows() << " rows";
            return std::move(builder).finish();
        }
    };
}

std::unique_ptr<INormalizer> make_earnings_normalizer() { return std::make_unique<EarningsNormalizer>(); }
