#pragma once
#include <boost/beast/http.hpp>

#include "pipeline/fanout_dispatcher.hpp"
#include "pipeline/retrieval_scanner.hpp"

namespace http = boost::beast::http;

// What the routes need from the running service.
struct LakeApi {
    FanoutDispatcher& dispatcher;
    const RetrievalScanner& scanner;
};

//   GET    /api/health
//   POST   /api/jobs          body: LogicalRequest JSON + "mode": "async"|"sync"
//   GET    /api/jobs/<id>
//   DELETE /api/jobs/<id>
//   POST   /api/datasets      body: LogicalRequest JSON + "on_missing": "fail"|"skip"
//                             (?on_missing=skip also accepted)
void handle_request(LakeApi& api,
                    const http::request<http::string_body>& req,
                    http::response<http::string_body>& res);
