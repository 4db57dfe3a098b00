#include "server/http_routes.hpp"
#include "server/request_json.hpp"
#include "schema/table_codec.hpp"
#include "test_support.hpp"

#include <chrono>
#include <thread>
#include <gtest/gtest.h>

class http_routes_test : public ::testing::Test {
public:
    void SetUp() override {
        store_ = std::shared_ptr<IObjectStore>(make_memory_store());
        readiness_ = std::make_shared<ToggleReadiness>();
        fetcher_ = std::make_shared<ScriptedFetcher>([](const SubRequest& sr) {
            return payload_for(sr, stock_eod_csv(start_date_of(sr.url)));
        });
        dispatcher_ = std::make_unique<FanoutDispatcher>(DispatcherOptions{2}, fetcher_, store_, readiness_);
        scanner_ = std::make_unique<RetrievalScanner>(store_);
    }

    void TearDown() override {
        dispatcher_->shutdown();
    }

    http::response<http::string_body> call(http::verb verb, std::string target, std::string body = {}) {
        http::request<http::string_body> req{verb, target, 11};
        req.body() = std::move(body);
        req.prepare_payload();
        http::response<http::string_body> res;
        LakeApi api{*dispatcher_, *scanner_};
        handle_request(api, req, res);
        return res;
    }

    static json body_of(const http::response<http::string_body>& res) { return json::parse(res.body()); }

    struct ToggleReadiness : IProviderReadiness {
        std::atomic<bool> up{true};
        bool ready() override { return up.load(); }
    };

    std::shared_ptr<IObjectStore> store_{};
    std::shared_ptr<ToggleReadiness> readiness_{};
    std::shared_ptr<ScriptedFetcher> fetcher_{};
    std::unique_ptr<FanoutDispatcher> dispatcher_{};
    std::unique_ptr<RetrievalScanner> scanner_{};
    LogCapture logs_{};
};

static const char* kSyncJob =
    R"({"kind": "stock_eod", "symbol": "SPY", "start": 20240102, "end": "2024-01-03", "mode": "sync"})";

TEST_F(http_routes_test, health) {
    auto res = call(http::verb::get, "/api/health");
    EXPECT_EQ(http::status::ok, res.result());
    EXPECT_EQ("ok", body_of(res)["status"]);
    EXPECT_EQ("application/json", std::string(res[http::field::content_type]));
}

TEST_F(http_routes_test, unknown_route) {
    EXPECT_EQ(http::status::not_found, call(http::verb::get, "/api/nothing").result());
    EXPECT_EQ(http::status::not_found, call(http::verb::put, "/api/jobs").result());
}

TEST_F(http_routes_test, sync_job_then_poll) {
    auto res = call(http::verb::post, "/api/jobs", kSyncJob);
    ASSERT_EQ(http::status::ok, res.result());
    auto report = body_of(res);
    EXPECT_EQ("finalized", report["state"]);
    EXPECT_TRUE(report["committed"].get<bool>());
    EXPECT_EQ(2, report["rows_written"].get<int>());
    EXPECT_EQ("historical-stock/eod/monthly/1d/SPY/2024/01/data.msgpack", report["written_keys"][0]);
    EXPECT_TRUE(report["commit_error"].is_null());

    const auto id = report["id"].get<std::string>();
    auto polled = call(http::verb::get, "/api/jobs/" + id);
    ASSERT_EQ(http::status::ok, polled.result());
    EXPECT_EQ(id, body_of(polled)["id"]);

    auto cancelled = call(http::verb::delete_, "/api/jobs/" + id);
    ASSERT_EQ(http::status::ok, cancelled.result());
    EXPECT_FALSE(body_of(cancelled)["cancelled"].get<bool>());
}

TEST_F(http_routes_test, async_job_is_accepted) {
    auto res = call(http::verb::post, "/api/jobs",
                    R"({"kind": "stock_eod", "symbol": "SPY", "start": 20240102, "end": 20240103})");
    ASSERT_EQ(http::status::accepted, res.result());
    const auto id = body_of(res)["id"].get<std::string>();
    ASSERT_FALSE(id.empty());
    json polled;
    for (int i = 0; i < 500; ++i) {
        polled = body_of(call(http::verb::get, "/api/jobs/" + id));
        if (polled["committed"].get<bool>()) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(polled["committed"].get<bool>());
    EXPECT_EQ(2, polled["rows_written"].get<int>());
    EXPECT_EQ(0, dispatcher_->tracker().size());
}

TEST_F(http_routes_test, unknown_job) {
    EXPECT_EQ(http::status::not_found, call(http::verb::get, "/api/jobs/job-999").result());
    EXPECT_EQ(http::status::not_found, call(http::verb::delete_, "/api/jobs/job-999").result());
}

TEST_F(http_routes_test, bad_requests) {
    EXPECT_EQ(http::status::bad_request, call(http::verb::post, "/api/jobs", "{not json").result());
    EXPECT_EQ(http::status::bad_request, call(http::verb::post, "/api/jobs", R"({"symbol": "SPY"})").result());
    EXPECT_EQ(http::status::bad_request,
              call(http::verb::post, "/api/jobs", R"({"kind": "stock_eod", "symbol": "SPY"})").result());
    EXPECT_EQ(http::status::bad_request,
              call(http::verb::post, "/api/jobs", R"({"kind": "bond_eod", "symbol": "SPY", "start": 20240102})").result());
    EXPECT_EQ(http::status::bad_request,
              call(http::verb::post, "/api/jobs",
                   R"({"kind": "stock_eod", "symbol": "SPY", "start": 20240106, "end": 20240107})").result());
    EXPECT_EQ(http::status::bad_request,
              call(http::verb::post, "/api/jobs",
                   R"({"kind": "stock_eod", "symbol": "SPY", "start": 20240102, "mode": "later"})").result());
    EXPECT_EQ(0, fetcher_->calls());
}

TEST_F(http_routes_test, provider_down) {
    readiness_->up = false;
    auto res = call(http::verb::post, "/api/jobs", kSyncJob);
    EXPECT_EQ(http::status::service_unavailable, res.result());
    EXPECT_EQ(0, fetcher_->calls());
}

TEST_F(http_routes_test, datasets) {
    ASSERT_EQ(http::status::ok, call(http::verb::post, "/api/jobs", kSyncJob).result());

    auto res = call(http::verb::post, "/api/datasets",
                    R"({"kind": "stock_eod", "symbol": "SPY", "start_yearmo": 202401})");
    ASSERT_EQ(http::status::ok, res.result());
    auto body = body_of(res);
    EXPECT_EQ("stock_eod", body["dataset"]);
    EXPECT_EQ(2, body["rows"].get<int>());
    ASSERT_EQ(17, body["columns"].size());
    EXPECT_EQ("ms_of_day", body["columns"][0]["name"]);
    EXPECT_EQ("int64", body["columns"][0]["type"]);
    EXPECT_EQ(20240103, body["columns"][16]["values"][1].get<int>());
    EXPECT_EQ(1, body["partitions"].size());
    EXPECT_TRUE(body["missing"].empty());
}

TEST_F(http_routes_test, datasets_missing_partition) {
    ASSERT_EQ(http::status::ok, call(http::verb::post, "/api/jobs", kSyncJob).result());
    const std::string range = R"({"kind": "stock_eod", "symbol": "SPY", "start_yearmo": 202401, "end_yearmo": 202402})";

    auto fail = call(http::verb::post, "/api/datasets", range);
    ASSERT_EQ(http::status::not_found, fail.result());
    EXPECT_EQ("historical-stock/eod/monthly/1d/SPY/2024/02/data.msgpack", body_of(fail)["key"]);

    auto skip = call(http::verb::post, "/api/datasets?on_missing=skip", range);
    ASSERT_EQ(http::status::ok, skip.result());
    EXPECT_EQ(2, body_of(skip)["rows"].get<int>());
    EXPECT_EQ(1, body_of(skip)["missing"].size());
}

TEST_F(http_routes_test, datasets_schema_drift) {
    auto obj = nlohmann::json::from_msgpack(TableCodec::encode(CanonicalTable(DatasetKind::StockEod)));
    obj["dataset"] = "stock_quote";
    store_->put("historical-stock/eod/monthly/1d/SPY/2024/01/data.msgpack", nlohmann::json::to_msgpack(obj));
    auto res = call(http::verb::post, "/api/datasets", R"({"kind": "stock_eod", "symbol": "SPY", "start_yearmo": 202401})");
    EXPECT_EQ(http::status::internal_server_error, res.result());
}

TEST_F(http_routes_test, request_json_fields) {
    auto r = request_from_json(json::parse(R"({
        "kind": "option_quote", "symbol": "QQQ", "start": "20240102", "end": "2024-02-15",
        "interval_ms": 60000, "expiration": 20240119, "granularity": "daily", "force_refresh": true
    })"));
    EXPECT_EQ(DatasetKind::OptionQuote, r.kind);
    EXPECT_EQ("QQQ", r.symbol);
    EXPECT_EQ(20240102, r.start->to_int());
    EXPECT_EQ(20240215, r.end->to_int());
    EXPECT_EQ(60000, r.interval_ms);
    EXPECT_EQ(20240119, r.expiration);
    EXPECT_EQ(FileGranularity::Daily, r.granularity);
    EXPECT_TRUE(r.force_refresh);

    auto e = request_from_json(json::parse(R"({"kind": "earnings", "start_yearmo": 202402})"));
    EXPECT_EQ(20240201, e.start->to_int());
    EXPECT_EQ(20240229, e.end->to_int());

    EXPECT_THROW(request_from_json(json::parse(R"({"kind": "stock_eod", "start": "soon"})")), std::invalid_argument);
    EXPECT_THROW(request_from_json(json::parse("[]")), std::invalid_argument);
}
