#include "config.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace
{
    std::string lower(std::string s)
    {
        for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return s;
    }

    template <typename T>
    T parse_number(const char* key, const std::string& raw, T min_value)
    {
        T v{};
        auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), v);
        if (ec != std::errc{} || ptr != raw.data() + raw.size() || v < min_value) {
            throw std::invalid_argument(std::string(key) + ": invalid number '" + raw + "'");
        }
        return v;
    }

    bool parse_bool(const char* key, const std::string& raw)
    {
        const auto v = lower(raw);
        if (v == "true" || v == "1" || v == "yes") return true;
        if (v == "false" || v == "0" || v == "no") return false;
        throw std::invalid_argument(std::string(key) + ": invalid boolean '" + raw + "'");
    }
}

const char* to_cstr(StorageBackend b)
{
    switch (b) {
        case StorageBackend::Minio:      return "minio";
        case StorageBackend::Filesystem: return "filesystem";
        case StorageBackend::Memory:     return "memory";
    }
    return "unknown";
}

StorageBackend parse_storage_backend(const std::string& s)
{
    if (s == "minio")      return StorageBackend::Minio;
    if (s == "filesystem") return StorageBackend::Filesystem;
    if (s == "memory")     return StorageBackend::Memory;
    throw std::invalid_argument("unknown storage backend '" + s + "'");
}

AppConfig AppConfig::from_env(const EnvLookup& env)
{
    AppConfig cfg;
    auto str = [&](const char* key, std::string& out) {
        if (const char* v = env(key)) out = v;
    };
    auto raw = [&](const char* key) -> std::string {
        const char* v = env(key);
        return v ? std::string(v) : std::string{};
    };

    str("MINIO_ENDPOINT", cfg.minio.endpoint);
    str("MINIO_ACCESS_KEY", cfg.minio.access_key);
    str("MINIO_SECRET_KEY", cfg.minio.secret_key);
    str("MINIO_BUCKET", cfg.minio.bucket);
    str("MINIO_REGION", cfg.minio.region);
    if (env("MINIO_SECURE")) cfg.minio.secure = parse_bool("MINIO_SECURE", raw("MINIO_SECURE"));

    if (env("MDLAKE_STORAGE")) cfg.storage.backend = parse_storage_backend(raw("MDLAKE_STORAGE"));
    str("MDLAKE_STORAGE_ROOT", cfg.storage.root);

    if (env("MDLAKE_MAX_WORKERS")) {
        cfg.general.max_workers = parse_number<std::size_t>("MDLAKE_MAX_WORKERS", raw("MDLAKE_MAX_WORKERS"), 1);
    }
    if (env("MDLAKE_HTTP_TIMEOUT")) {
        cfg.general.http_timeout_s = parse_number<long>("MDLAKE_HTTP_TIMEOUT", raw("MDLAKE_HTTP_TIMEOUT"), 1);
    }
    if (env("MDLAKE_MAX_RETRIES")) {
        cfg.general.max_retries = parse_number<int>("MDLAKE_MAX_RETRIES", raw("MDLAKE_MAX_RETRIES"), 0);
        if (cfg.general.max_retries > kMaxRetries) {
            throw std::invalid_argument("MDLAKE_MAX_RETRIES: at most " + std::to_string(kMaxRetries));
        }
    }
    if (env("MDLAKE_LOG_LEVEL")) cfg.general.log_level = parse_log_level(raw("MDLAKE_LOG_LEVEL"));

    str("THETA_BASE_URL", cfg.theta.base_url);

    if (env("MDLAKE_HTTP_THREADS")) {
        cfg.server.io_threads = parse_number<int>("MDLAKE_HTTP_THREADS", raw("MDLAKE_HTTP_THREADS"), 1);
    }
    if (env("MDLAKE_HTTP_PORT")) {
        const auto port = parse_number<unsigned>("MDLAKE_HTTP_PORT", raw("MDLAKE_HTTP_PORT"), 1);
        if (port > 65535) throw std::invalid_argument("MDLAKE_HTTP_PORT: out of range");
        cfg.server.port = static_cast<unsigned short>(port);
    }

    cfg.minio.timeout_s = cfg.general.http_timeout_s;
    return cfg;
}

bool load_env_file(const std::string& filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open()) {
        // Try in backend directory if not found
        file.open("backend/" + filepath);
        if (!file.is_open()) {
            return false;
        }
    }

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = line.substr(0, eq_pos);
        std::string value = line.substr(eq_pos + 1);

        key.erase(0, key.find_first_not_of(" \t"));
        key.erase(key.find_last_not_of(" \t") + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t") + 1);
        if (key.rfind("export ", 0) == 0) key = key.substr(7);

        if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                                  (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.length() - 2);
        }

        // 0 = don't overwrite existing
        setenv(key.c_str(), value.c_str(), 0);
    }
    return true;
}
