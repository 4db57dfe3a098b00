#include "server/config.hpp"
#include "server/lake_runtime.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <gtest/gtest.h>

class config_test : public ::testing::Test {
public:
    static AppConfig from(std::map<std::string, std::string> vars) {
        return AppConfig::from_env([&vars](const char* k) -> const char* {
            auto it = vars.find(k);
            return it == vars.end() ? nullptr : it->second.c_str();
        });
    }
};

TEST_F(config_test, defaults) {
    auto cfg = from({});
    EXPECT_EQ("localhost:9000", cfg.minio.endpoint);
    EXPECT_EQ("minioadmin", cfg.minio.access_key);
    EXPECT_EQ("betedge-data", cfg.minio.bucket);
    EXPECT_FALSE(cfg.minio.secure);
    EXPECT_EQ(StorageBackend::Minio, cfg.storage.backend);
    EXPECT_EQ(2, cfg.general.max_workers);
    EXPECT_EQ(60, cfg.general.http_timeout_s);
    EXPECT_EQ(3, cfg.general.max_retries);
    EXPECT_EQ(LogLevel::Info, cfg.general.log_level);
    EXPECT_EQ("http://127.0.0.1:25510/v2", cfg.theta.base_url);
    EXPECT_EQ(8080, cfg.server.port);
    EXPECT_EQ(8, cfg.server.io_threads);
}

TEST_F(config_test, overrides) {
    auto cfg = from({
        {"MINIO_ENDPOINT", "minio.internal:9000"},
        {"MINIO_BUCKET", "lake"},
        {"MINIO_SECURE", "TRUE"},
        {"MDLAKE_STORAGE", "filesystem"},
        {"MDLAKE_STORAGE_ROOT", "/var/lib/mdlake"},
        {"MDLAKE_MAX_WORKERS", "8"},
        {"MDLAKE_HTTP_TIMEOUT", "15"},
        {"MDLAKE_MAX_RETRIES", "0"},
        {"MDLAKE_LOG_LEVEL", "debug"},
        {"THETA_BASE_URL", "http://theta:25510/v2"},
        {"MDLAKE_HTTP_PORT", "9090"},
        {"MDLAKE_HTTP_THREADS", "3"},
    });
    EXPECT_EQ("minio.internal:9000", cfg.minio.endpoint);
    EXPECT_EQ("lake", cfg.minio.bucket);
    EXPECT_TRUE(cfg.minio.secure);
    EXPECT_EQ(StorageBackend::Filesystem, cfg.storage.backend);
    EXPECT_EQ("/var/lib/mdlake", cfg.storage.root);
    EXPECT_EQ(8, cfg.general.max_workers);
    EXPECT_EQ(15, cfg.general.http_timeout_s);
    EXPECT_EQ(15, cfg.minio.timeout_s);
    EXPECT_EQ(0, cfg.general.max_retries);
    EXPECT_EQ(LogLevel::Debug, cfg.general.log_level);
    EXPECT_EQ("http://theta:25510/v2", cfg.theta.base_url);
    EXPECT_EQ(9090, cfg.server.port);
    EXPECT_EQ(3, cfg.server.io_threads);
}

TEST_F(config_test, malformed_values) {
    EXPECT_THROW(from({{"MDLAKE_MAX_WORKERS", "four"}}), std::invalid_argument);
    EXPECT_THROW(from({{"MDLAKE_MAX_WORKERS", "0"}}), std::invalid_argument);
    EXPECT_THROW(from({{"MDLAKE_HTTP_TIMEOUT", "10s"}}), std::invalid_argument);
    EXPECT_THROW(from({{"MDLAKE_MAX_RETRIES", "-1"}}), std::invalid_argument);
    EXPECT_THROW(from({{"MDLAKE_MAX_RETRIES", "64"}}), std::invalid_argument);
    EXPECT_EQ(kMaxRetries, from({{"MDLAKE_MAX_RETRIES", "10"}}).general.max_retries);
    EXPECT_THROW(from({{"MDLAKE_HTTP_THREADS", "0"}}), std::invalid_argument);
    EXPECT_THROW(from({{"MINIO_SECURE", "maybe"}}), std::invalid_argument);
    EXPECT_THROW(from({{"MDLAKE_STORAGE", "s3"}}), std::invalid_argument);
    EXPECT_THROW(from({{"MDLAKE_HTTP_PORT", "70000"}}), std::invalid_argument);
    EXPECT_THROW(from({{"MDLAKE_LOG_LEVEL", "loud"}}), std::invalid_argument);
}

TEST_F(config_test, env_file_does_not_override) {
    const auto path = std::filesystem::temp_directory_path() /
        ("mdlake-env-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    {
        std::ofstream out(path);
        out << "# comment\n"
            << "MDLAKE_TEST_FROM_FILE=\"quoted value\"\n"
            << "export MDLAKE_TEST_EXPORTED=yes\r\n"
            << "MDLAKE_TEST_PRESET=file\n"
            << "not a pair\n";
    }
    setenv("MDLAKE_TEST_PRESET", "process", 1);

    ASSERT_TRUE(load_env_file(path.string()));
    EXPECT_STREQ("quoted value", std::getenv("MDLAKE_TEST_FROM_FILE"));
    EXPECT_STREQ("yes", std::getenv("MDLAKE_TEST_EXPORTED"));
    EXPECT_STREQ("process", std::getenv("MDLAKE_TEST_PRESET"));

    std::filesystem::remove(path);
    EXPECT_FALSE(load_env_file(path.string()));
}

TEST_F(config_test, memory_backend_store) {
    auto store = make_object_store(from({{"MDLAKE_STORAGE", "memory"}}));
    ASSERT_NE(nullptr, store);
    EXPECT_EQ("memory", store->describe());
}

TEST_F(config_test, backend_names) {
    for (auto b : {StorageBackend::Minio, StorageBackend::Filesystem, StorageBackend::Memory}) {
        EXPECT_EQ(b, parse_storage_backend(to_cstr(b)));
    }
}
