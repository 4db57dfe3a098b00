#pragma once
#include <memory>

#include "config.hpp"
#include "pipeline/fanout_dispatcher.hpp"
#include "pipeline/retrieval_scanner.hpp"

// Process-wide collaborators built from AppConfig at start-up.
struct LakeRuntime {
    std::shared_ptr<IObjectStore> store;
    std::unique_ptr<FanoutDispatcher> dispatcher;
    std::unique_ptr<RetrievalScanner> scanner;

    // Throws StorageError when the configured store is unreachable.
    static LakeRuntime from_config(const AppConfig& cfg);
};

std::shared_ptr<IObjectStore> make_object_store(const AppConfig& cfg);
