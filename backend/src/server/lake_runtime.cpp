#include "lake_runtime.hpp"
#include "util/log.hpp"

#include <stdexcept>

std::shared_ptr<IObjectStore> make_object_store(const AppConfig& cfg)
{
    switch (cfg.storage.backend) {
        case StorageBackend::Minio:      return make_minio_store(cfg.minio);
        case StorageBackend::Filesystem: return make_filesystem_store(cfg.storage.root);
        case StorageBackend::Memory:     return make_memory_store();
    }
    throw std::invalid_argument("unknown storage backend");
}

LakeRuntime LakeRuntime::from_config(const AppConfig& cfg)
{
    LakeRuntime rt;
    rt.store = make_object_store(cfg);

    RequestExpander expander(cfg.theta.base_url);
    std::shared_ptr<IFetcher> fetcher =
        make_retrying_fetcher(make_curl_fetcher(cfg.general.http_timeout_s), cfg.general.max_retries);
    std::shared_ptr<IProviderReadiness> readiness = make_http_readiness(expander.probe_url());

    DispatcherOptions opts;
    opts.max_workers = cfg.general.max_workers;
    rt.dispatcher = std::make_unique<FanoutDispatcher>(opts, std::move(fetcher), rt.store,
                                                       std::move(readiness), std::move(expander));
    rt.scanner = std::make_unique<RetrievalScanner>(rt.store);

    log_info("setup") << "storage " << rt.store->describe() << ", provider " << cfg.theta.base_url
                      << ", " << cfg.general.max_workers << " workers";
    return rt;
}
