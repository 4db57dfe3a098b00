#include <nlohmann/json.hpp>
#include <cstdio>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "lake/errors.hpp"
#include "lake/partition_key.hpp"
#include "server/config.hpp"
#include "server/lake_runtime.hpp"
#include "server/request_json.hpp"
#include "util/log.hpp"

using json = nlohmann::json;

namespace
{
    int usage()
    {
        std::cerr <<
            "usage:\n"
            "  lakectl request  <kind> <symbol> <start YYYYMMDD> <end YYYYMMDD> [--daily] [--interval MS] [--force] [--async]\n"
            "  lakectl earnings <start YYYYMM> <end YYYYMM> [--force]\n"
            "  lakectl retrieve <kind> <symbol|-> <start YYYYMM> [end YYYYMM | --all] [--daily] [--skip-missing] [--json]\n"
            "  lakectl keys     <kind> <symbol|-> <start YYYYMM> [end YYYYMM] [--daily]\n";
        return 2;
    }

    struct Args {
        std::vector<std::string> positional;
        bool daily{false};
        bool force{false};
        bool async{false};
        bool all{false};
        bool skip_missing{false};
        bool as_json{false};
        std::int64_t interval_ms{3'600'000};
    };

    Args parse_args(int argc, char** argv)
    {
        Args a;
        for (int i = 2; i < argc; ++i) {
            const std::string s = argv[i];
            if (s == "--daily")             a.daily = true;
            else if (s == "--force")        a.force = true;
            else if (s == "--async")        a.async = true;
            else if (s == "--all")          a.all = true;
            else if (s == "--skip-missing") a.skip_missing = true;
            else if (s == "--json")         a.as_json = true;
            else if (s == "--interval") {
                if (i + 1 >= argc) throw std::invalid_argument("--interval needs a value");
                a.interval_ms = std::stoll(argv[++i]);
            } else if (s.rfind("--", 0) == 0) {
                throw std::invalid_argument("unknown option " + s);
            } else {
                a.positional.push_back(s);
            }
        }
        return a;
    }

    // <kind> <symbol|-> <start YYYYMM> [end YYYYMM]
    LogicalRequest month_request(const Args& a)
    {
        LogicalRequest r;
        r.kind = parse_dataset_kind(a.positional.at(0));
        if (a.positional.at(1) != "-") r.symbol = a.positional[1];
        r.granularity = a.daily ? FileGranularity::Daily : FileGranularity::Monthly;
        r.interval_ms = a.interval_ms;
        r.all = a.all;
        if (a.positional.size() > 2) {
            const auto start = YearMonth::from_int(std::stoll(a.positional[2]));
            const auto end = a.positional.size() > 3 ? YearMonth::from_int(std::stoll(a.positional[3])) : start;
            r.start = start.first_day();
            r.end = end.last_day();
        }
        return r;
    }

    int cmd_keys(const Args& a)
    {
        if (a.positional.size() < 3) return usage();
        const auto r = month_request(a);
        validate(r, RequestUse::Read);
        for (const auto& k : PartitionAddressing::keys_for(r.scope(), r.start_month(), r.end_month())) {
            std::cout << k.path << "\n";
        }
        return 0;
    }

    int cmd_request(const AppConfig& cfg, const LogicalRequest& r, bool async)
    {
        auto rt = LakeRuntime::from_config(cfg);
        auto handle = rt.dispatcher->submit(r, async ? SubmitMode::Async : SubmitMode::Sync);
        // The pool drains before exit, so an async submit still completes here.
        if (async) std::cout << report_to_json(handle.report()).dump(2) << std::endl;
        rt.dispatcher->shutdown();
        const auto report = handle.report();
        std::cout << report_to_json(report).dump(2) << std::endl;
        return report.failed_slots.empty() && !report.commit_error ? 0 : 1;
    }

    int cmd_retrieve(const AppConfig& cfg, const Args& a)
    {
        if (a.positional.size() < 2 || (a.positional.size() < 3 && !a.all)) return usage();
        const auto r = month_request(a);
        auto store = make_object_store(cfg);
        RetrievalScanner scanner(store);
        const auto dataset = scanner.retrieve(r, a.skip_missing ? MissingPolicy::Skip : MissingPolicy::Fail);
        const auto table = dataset.collect();
        if (a.as_json) {
            std::cout << table_to_json(table).dump() << std::endl;
        } else {
            std::cout << to_cstr(table.kind()) << ": " << table.num_rows() << " rows from "
                      << dataset.partition_count() << " partitions";
            if (!dataset.missing().empty()) std::cout << " (" << dataset.missing().size() << " missing)";
            std::cout << std::endl;
        }
        return 0;
    }
}

int main(int argc, char** argv)
{
    if (argc < 2) return usage();
    const std::string cmd = argv[1];

    try {
        load_env_file();
        const AppConfig cfg = AppConfig::from_env();
        set_log_level(cfg.general.log_level);
        const Args a = parse_args(argc, argv);

        if (cmd == "keys") return cmd_keys(a);
        if (cmd == "retrieve") return cmd_retrieve(cfg, a);
        if (cmd == "request") {
            if (a.positional.size() != 4) return usage();
            LogicalRequest r;
            r.kind = parse_dataset_kind(a.positional[0]);
            r.symbol = a.positional[1];
            r.start = Date::from_int(std::stoll(a.positional[2]));
            r.end = Date::from_int(std::stoll(a.positional[3]));
            r.granularity = a.daily ? FileGranularity::Daily : FileGranularity::Monthly;
            r.interval_ms = a.interval_ms;
            r.force_refresh = a.force;
            return cmd_request(cfg, r, a.async);
        }
        if (cmd == "earnings") {
            if (a.positional.size() != 2) return usage();
            const auto r = LogicalRequest::earnings(YearMonth::from_int(std::stoll(a.positional[0])),
                                                    YearMonth::from_int(std::stoll(a.positional[1])), a.force);
            return cmd_request(cfg, r, a.async);
        }
        return usage();
    } catch (const MissingPartitionError& e) {
        log_error("lakectl") << e.what();
        return 3;
    } catch (const std::exception& e) {
        log_error("lakectl") << e.what();
        return 1;
    }
}
