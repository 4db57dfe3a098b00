#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <exception>
#include <thread>
#include <vector>

#include "server/config.hpp"
#include "server/http_routes.hpp"
#include "server/http_server.hpp"
#include "server/lake_runtime.hpp"
#include "util/log.hpp"

using tcp = boost::asio::ip::tcp;

int main() {
    AppConfig cfg;
    try {
        if (load_env_file()) log_info("setup") << "loaded .env";
        cfg = AppConfig::from_env();
    } catch (const std::exception& e) {
        log_error("setup") << "bad configuration: " << e.what();
        return 2;
    }
    set_log_level(cfg.general.log_level);

    LakeRuntime rt;
    try {
        rt = LakeRuntime::from_config(cfg);
    } catch (const std::exception& e) {
        log_error("setup") << "cannot start: " << e.what();
        return 1;
    }

    LakeApi api{*rt.dispatcher, *rt.scanner};

    // Independent of the fetch pool: each sync submission holds one of these until commit.
    const int threads = cfg.server.io_threads;
    boost::asio::io_context ioc{threads};
    tcp::endpoint ep{boost::asio::ip::make_address("0.0.0.0"), cfg.server.port};
    HttpServer server{ioc, ep, [&](auto const& req, auto& res){
        handle_request(api, req, res);
    }};
    server.run();

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](boost::beast::error_code, int sig) {
        log_info("setup") << "signal " << sig << ", shutting down";
        server.stop();
        ioc.stop();
    });

    log_info("setup") << "HTTP listening on :" << cfg.server.port << " with " << threads << " io threads";

    std::vector<std::thread> pool;
    for (int i = 1; i < threads; ++i) {
        pool.emplace_back([&ioc] { ioc.run(); });
    }
    ioc.run();
    for (auto& t : pool) t.join();

    rt.dispatcher->shutdown();
    return 0;
}
