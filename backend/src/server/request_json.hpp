#pragma once
#include <nlohmann/json.hpp>

#include "lake/logical_request.hpp"
#include "pipeline/fanout_dispatcher.hpp"
#include "schema/canonical_table.hpp"

using json = nlohmann::json;

// {"kind":"option_eod","symbol":"SPY","start":20240102,"end":20240329,
//  "granularity":"monthly","interval_ms":3600000,"expiration":0,"force_refresh":false}
// Earnings (or any kind) may give "start_yearmo"/"end_yearmo" instead of dates;
// retrieval may give "all": true.
// Throws std::invalid_argument for malformed fields.
LogicalRequest request_from_json(const json& j);

json report_to_json(const JobReport& r);
json snapshot_to_json(const JobSnapshot& s);

// {"dataset":..., "rows":n, "columns":[{"name","type","values":[...]}]}
json table_to_json(const CanonicalTable& t);
