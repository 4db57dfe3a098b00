#pragma once
#include <cstddef>
#include <cstdlib>
#include <functional>
#include <string>

#include "storage/minio_store.hpp"
#include "util/log.hpp"

enum class StorageBackend { Minio, Filesystem, Memory };

const char* to_cstr(StorageBackend b);
StorageBackend parse_storage_backend(const std::string& s);

constexpr int kMaxRetries = 10;

struct GeneralConfig {
    std::size_t max_workers{2};
    long http_timeout_s{60};
    int max_retries{3};
    LogLevel log_level{LogLevel::Info};
};

struct ThetaConfig {
    std::string base_url{"http://127.0.0.1:25510/v2"};
};

struct StorageConfig {
    StorageBackend backend{StorageBackend::Minio};
    std::string root{"./lake"};
};

struct ServerConfig {
    unsigned short port{8080};
    // Sync submissions park an io thread until commit; the rest keep serving.
    int io_threads{8};
};

// Built once at start-up and passed down; nothing reads the environment afterwards.
struct AppConfig {
    MinioOptions minio;
    GeneralConfig general;
    ThetaConfig theta;
    StorageConfig storage;
    ServerConfig server;

    using EnvLookup = std::function<const char*(const char*)>;

    // Throws std::invalid_argument for malformed numbers, booleans or enum values.
    static AppConfig from_env(const EnvLookup& env = [](const char* k) { return static_cast<const char*>(std::getenv(k)); });
};

// KEY=VALUE lines, '#' comments, optional quotes. Never overrides variables already set.
// Tries `filepath`, then "backend/" + filepath. Returns false when neither exists.
bool load_env_file(const std::string& filepath = ".env");
