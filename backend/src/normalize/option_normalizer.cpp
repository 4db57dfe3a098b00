#include "normalizer.hpp"
#include "csv_reader.hpp"
#include "lake/errors.hpp"
#include "util/log.hpp"

namespace
{
    // Contract columns that lead every option schema.
    constexpr std::size_t kContractColumns = 4;

    struct OptionNormalizer : INormalizer
    {
        CanonicalTable normalize(const RawPayload &payload, DatasetKind kind) const override
        {
            if (!is_option(kind)) {
                throw SchemaMismatchError(std::string("option normalizer cannot produce ") + to_cstr(kind));
            }
            const auto doc = parse_csv(payload.body);
            return payload.underlying ? from_underlying(doc, payload, kind) : from_bulk(doc, kind);
        }

    private:
        static CanonicalTable from_bulk(const CsvDocument &doc, DatasetKind kind)
        {
            expect_columns(doc, SchemaRegistry::instance().spec(kind), kind);
            TableBuilder builder(kind);
            for (const auto &row : doc.rows) {
                builder.append_text_row(row);
            }
            log_debug("normalize") << to_cstr(kind) << ": " << builder.num_rows() << " option rows";
            return std::move(builder).finish();
        }

        // A stock series fetched for the option root: parse it against the stock schema of
        // the same endpoint, then lead with root / expiration=0 / strike=null / right=null.
        static CanonicalTable from_underlying(const CsvDocument &doc, const RawPayload &payload, DatasetKind kind)
        {
            const DatasetKind stock = underlying_kind(kind);
            expect_columns(doc, SchemaRegistry::instance().spec(stock), stock);
            if (payload.root.empty()) {
                throw SchemaMismatchError("underlying payload without a root: " + payload.source_url);
            }

            TableBuilder builder(kind);
            for (const auto &row : doc.rows) {
                builder.append_string(0, payload.root);
                builder.append_int(1, 0);
                builder.append_null(2);
                builder.append_null(3);
                for (std::size_t i = 0; i < row.size(); ++i) {
                    builder.append_text(kContractColumns + i, row[i]);
                }
                builder.end_row();
            }
            log_debug("normalize") << to_cstr(kind) << ": " << builder.num_rows() << " underlying rows for "
                                   << payload.root;
            return std::move(builder).finish();
        }
    };
}

std::unique_ptr<INormalizer> make_option_normalizer() { return std::make_unique<OptionNormalizer>(); }
