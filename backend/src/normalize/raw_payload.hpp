#pragma once
#include <cstdint>
#include <string>

enum class ContentType : std::uint8_t { Csv, Json };

inline const char* to_cstr(ContentType t) { return t == ContentType::Json ? "json" : "csv"; }

// Response body of one sub-request, owned by the worker that fetched it until normalized.
struct RawPayload {
    std::string body;
    ContentType content_type{ContentType::Csv};
    std::string source_url;
    std::string root;          // symbol the request was issued for
    bool underlying{false};    // stock series carried by an option request
    bool no_data{false};       // provider says the period legitimately has no data
};
