/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading and environment overrides.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace sandbox_engine;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "se_test_config";
        std::filesystem::create_directories(temp_dir_);
        clear_env();
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
        clear_env();
    }

    static void clear_env() {
        ::unsetenv("MAX_EXECUTION_TIME_MS");
        ::unsetenv("MAX_MEMORY_MB");
        ::unsetenv("MAX_OUTPUT_SIZE_KB");
        ::unsetenv("MAX_CONCURRENT_EXECUTIONS");
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.engine.max_concurrent, 5u);
    EXPECT_EQ(config.engine.default_timeout_ms, 30000u);
    EXPECT_EQ(config.engine.default_memory_limit_mb, 512u);
    EXPECT_EQ(config.max_output_bytes(), 1024u * 1024);
    EXPECT_EQ(config.limits.max_code_bytes, 100000u);
    EXPECT_EQ(config.container.socket_path, "/var/run/docker.sock");
    EXPECT_TRUE(validate_config(config));
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [engine]
        max_concurrent = 8
        default_timeout_ms = 5000
        default_memory_limit_mb = 256
        max_output_kb = 64
        record_ttl_ms = 1000
        sweep_interval_ms = 500

        [limits]
        max_code_bytes = 2048
        min_timeout_ms = 20
        max_timeout_ms = 10000

        [container]
        socket_path = "/run/user/1000/docker.sock"
        workspace_root = "/var/tmp/se"
        pids_limit = 32

        [telemetry]
        log_dir = "/var/log/se"
        log_level = "debug"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    const auto& c = *result;
    EXPECT_EQ(c.engine.max_concurrent, 8u);
    EXPECT_EQ(c.engine.default_timeout_ms, 5000u);
    EXPECT_EQ(c.engine.default_memory_limit_mb, 256u);
    EXPECT_EQ(c.max_output_bytes(), 64u * 1024);
    EXPECT_EQ(c.engine.record_ttl_ms, 1000u);
    EXPECT_EQ(c.engine.sweep_interval_ms, 500u);
    EXPECT_EQ(c.limits.max_code_bytes, 2048u);
    EXPECT_EQ(c.limits.min_timeout_ms, 20u);
    EXPECT_EQ(c.container.socket_path, "/run/user/1000/docker.sock");
    EXPECT_EQ(c.container.workspace_root, "/var/tmp/se");
    EXPECT_EQ(c.container.pids_limit, 32);
    EXPECT_EQ(c.telemetry.log_dir, "/var/log/se");
    EXPECT_EQ(c.telemetry.log_level, "debug");
}

TEST_F(ConfigTest, PartialConfigKeepsDefaults) {
    auto path = write_toml(R"(
        [engine]
        max_concurrent = 2
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->engine.max_concurrent, 2u);
    EXPECT_EQ(result->engine.default_timeout_ms, 30000u);
    EXPECT_EQ(result->limits.max_memory_mb, 2048u);
}

TEST_F(ConfigTest, MissingFile) {
    auto result = load_config(temp_dir_ / "nonexistent.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST_F(ConfigTest, InvalidToml) {
    auto path = write_toml("this is [not valid toml");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ValidationFailed);
}

TEST_F(ConfigTest, InconsistentBoundsRejected) {
    auto path = write_toml(R"(
        [limits]
        min_timeout_ms = 5000
        max_timeout_ms = 100
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ValidationFailed);
}

TEST_F(ConfigTest, ZeroConcurrencyRejected) {
    auto config = default_config();
    config.engine.max_concurrent = 0;
    EXPECT_FALSE(validate_config(config));
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    ::setenv("MAX_EXECUTION_TIME_MS", "1500", 1);
    ::setenv("MAX_MEMORY_MB", "128", 1);
    ::setenv("MAX_OUTPUT_SIZE_KB", "32", 1);
    ::setenv("MAX_CONCURRENT_EXECUTIONS", "3", 1);

    auto config = default_config();
    ASSERT_TRUE(apply_env_overrides(config));
    EXPECT_EQ(config.engine.default_timeout_ms, 1500u);
    EXPECT_EQ(config.engine.default_memory_limit_mb, 128u);
    EXPECT_EQ(config.max_output_bytes(), 32u * 1024);
    EXPECT_EQ(config.engine.max_concurrent, 3u);
}

TEST_F(ConfigTest, UnsetEnvironmentLeavesConfig) {
    auto config = default_config();
    ASSERT_TRUE(apply_env_overrides(config));
    EXPECT_EQ(config.engine.max_concurrent, 5u);
}

TEST_F(ConfigTest, MalformedEnvironmentRejected) {
    ::setenv("MAX_CONCURRENT_EXECUTIONS", "lots", 1);
    auto config = default_config();
    auto r = apply_env_overrides(config);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ValidationFailed);
    EXPECT_EQ(config.engine.max_concurrent, 5u);

    ::setenv("MAX_CONCURRENT_EXECUTIONS", "0", 1);
    EXPECT_FALSE(apply_env_overrides(config));
}
