#include "normalizer.hpp"
#include "csv_reader.hpp"
#include "lake/errors.hpp"
#include "util/log.hpp"

namespace
{
    struct StockNormalizer : INormalizer
    {
        CanonicalTable normalize(const RawPayload &payload, DatasetKind kind) const override
        {
            if (!is_stock(kind)) {
                throw SchemaMismatchError(std::string("stock normalizer cannot produce ") + to_cstr(kind));
            }
            const auto doc = parse_csv(payload.body);
            expect_columns(doc, SchemaRegistry::instance().spec(kind), kind);

            TableBuilder builder(kind);
            for (const auto &row : doc.rows) {
                builder.append_text_row(row);
            }
            log_debug("normalize") << to_cstr(kind) << ": " << builder.num_rows() << " rows for " << payload.root;
            return std::move(builder).finish();
        }
    };
}

std::unique_ptr<INormalizer> make_stock_normalizer() { return std::make_unique<StockNormalizer>(); }
