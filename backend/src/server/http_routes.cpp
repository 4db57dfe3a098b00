#include "http_routes.hpp"
#include "request_json.hpp"
#include "lake/errors.hpp"
#include "util/log.hpp"

#include <boost/url.hpp>

#include <string_view>

namespace urls = boost::urls;

namespace
{
    constexpr std::string_view kJobsPrefix = "/api/jobs/";

    void reply(http::response<http::string_body>& res, http::status status, const json& body)
    {
        res.result(status);
        res.set(http::field::content_type, "application/json");
        res.body() = body.dump();
    }

    void reply_error(http::response<http::string_body>& res, http::status status, std::string_view msg)
    {
        reply(res, status, json{{"error", std::string(msg)}});
    }

    json parse_body(const http::request<http::string_body>& req)
    {
        if (req.body().empty()) return json::object();
        return json::parse(req.body());
    }

    void route(LakeApi& api,
               const http::request<http::string_body>& req,
               http::response<http::string_body>& res,
               const urls::url_view& url)
    {
        const std::string path = url.path();

        // /api/health
        if (req.method() == http::verb::get && path == "/api/health") {
            reply(res, http::status::ok, json{{"status", "ok"}});
            return;
        }

        // POST /api/jobs
        if (req.method() == http::verb::post && path == "/api/jobs") {
            const json body = parse_body(req);
            const SubmitMode mode = parse_submit_mode(body.value("mode", std::string("async")));
            auto handle = api.dispatcher.submit(request_from_json(body), mode);
            reply(res, mode == SubmitMode::Sync ? http::status::ok : http::status::accepted,
                  report_to_json(handle.report()));
            return;
        }

        // /api/jobs/<id>
        if (path.size() > kJobsPrefix.size() && path.compare(0, kJobsPrefix.size(), kJobsPrefix) == 0) {
            const std::string id = path.substr(kJobsPrefix.size());
            if (req.method() == http::verb::get) {
                auto report = api.dispatcher.poll(id);
                if (!report) return reply_error(res, http::status::not_found, "unknown job " + id);
                reply(res, http::status::ok, report_to_json(*report));
                return;
            }
            if (req.method() == http::verb::delete_) {
                if (!api.dispatcher.poll(id)) return reply_error(res, http::status::not_found, "unknown job " + id);
                const bool cancelled = api.dispatcher.cancel(id);
                reply(res, http::status::ok, json{{"id", id}, {"cancelled", cancelled}});
                return;
            }
        }

        // POST /api/datasets
        if (req.method() == http::verb::post && path == "/api/datasets") {
            const json body = parse_body(req);
            std::string policy = body.value("on_missing", std::string("fail"));
            for (auto const& p : url.params()) {
                if (p.key == "on_missing") policy = std::string(p.value);
            }
            const auto dataset = api.scanner.retrieve(request_from_json(body), parse_missing_policy(policy));
            json out = table_to_json(dataset.collect());
            out["partitions"] = dataset.keys();
            out["missing"] = dataset.missing();
            reply(res, http::status::ok, out);
            return;
        }

        reply_error(res, http::status::not_found, "not found");
    }
}

void handle_request(LakeApi& api,
                    const http::request<http::string_body>& req,
                    http::response<http::string_body>& res)
{
    res.set(http::field::server, "mdlake/0.1");

    // Parse the target as an origin-form URL
    std::string_view target{req.target().data(), req.target().size()};
    auto parsed_result = urls::parse_origin_form(target);
    if (!parsed_result) {
        reply_error(res, http::status::bad_request, "bad request");
        return;
    }

    try {
        route(api, req, res, *parsed_result);
    } catch (const json::exception& e) {
        reply_error(res, http::status::bad_request, e.what());
    } catch (const InvalidRangeError& e) {
        reply_error(res, http::status::bad_request, e.what());
    } catch (const EmptyExpansionError& e) {
        reply_error(res, http::status::bad_request, e.what());
    } catch (const std::invalid_argument& e) {
        reply_error(res, http::status::bad_request, e.what());
    } catch (const ProviderNotReadyError& e) {
        reply_error(res, http::status::service_unavailable, e.what());
    } catch (const MissingPartitionError& e) {
        reply(res, http::status::not_found, json{{"error", e.what()}, {"key", e.key()}});
    } catch (const SchemaMismatchError& e) {
        log_error("http") << e.what();
        reply_error(res, http::status::internal_server_error, e.what());
    } catch (const std::exception& e) {
        log_error("http") << req.method_string() << " " << target << ": " << e.what();
        reply_error(res, http::status::internal_server_error, e.what());
    }
}
