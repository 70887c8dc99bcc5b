/**
 * @file test_telemetry.cpp
 * @brief Unit tests for Logger, log sinks and MetricsCollector.
 * @author Dimitris Kafetzis
 */

#include "core/logger.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

using namespace sandbox_engine;

// ═══════════════════════════════════════════════
// Logger
// ═══════════════════════════════════════════════

TEST(LoggerTest, EmitsComponentAndEscapedMessage) {
    auto sink = std::make_unique<MemorySink>();
    auto* raw = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug, "v8");

    logger.info("line \"one\"\nline two");

    auto lines = raw->lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find(R"("level":"info")"), std::string::npos);
    EXPECT_NE(lines[0].find(R"("component":"v8")"), std::string::npos);
    EXPECT_NE(lines[0].find(R"(line \"one\"\nline two)"), std::string::npos);
}

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    auto sink = std::make_unique<MemorySink>();
    auto* raw = sink.get();
    Logger logger(std::move(sink), LogLevel::Warn);

    logger.debug("hidden");
    logger.info("hidden");
    logger.warn("shown");
    logger.error("shown too");
    EXPECT_EQ(raw->lines().size(), 2u);
    EXPECT_FALSE(raw->contains("hidden"));

    logger.set_level(LogLevel::Debug);
    logger.debug("now visible");
    EXPECT_TRUE(raw->contains("now visible"));
}

TEST(LoggerTest, ParseLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}

TEST(LoggerTest, JsonEscapeControlCharacters) {
    EXPECT_EQ(json_escape("a\tb"), "a\\tb");
    EXPECT_EQ(json_escape(std::string_view("\x01", 1)), "\\u0001");
    EXPECT_EQ(json_escape("back\\slash"), "back\\\\slash");
}

// ═══════════════════════════════════════════════
// JsonFileSink
// ═══════════════════════════════════════════════

class JsonFileSinkTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "se_test_sink";
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    static size_t count_lines(const std::filesystem::path& path) {
        std::ifstream in(path);
        size_t n = 0;
        for (std::string line; std::getline(in, line);) ++n;
        return n;
    }
};

TEST_F(JsonFileSinkTest, WritesLinesToLiveFile) {
    {
        JsonFileSink sink(dir_, "engine");
        sink.write(R"({"a":1})");
        sink.write(R"({"a":2})");
        sink.flush();
        EXPECT_EQ(sink.current_path(), dir_ / "engine.ndjson");
    }
    EXPECT_EQ(count_lines(dir_ / "engine.ndjson"), 2u);
}

TEST_F(JsonFileSinkTest, RotatesBySizeAndCapsFileCount) {
    {
        JsonFileSink sink(dir_, "engine", 1, 2);
        sink.set_max_file_size_bytes(16);
        // 15 bytes per line: the third write onto a file rotates it
        for (int i = 0; i < 10; ++i) {
            sink.write(R"({"line":"abc"})");
        }
        sink.flush();
    }

    EXPECT_TRUE(std::filesystem::exists(dir_ / "engine.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "engine.1.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "engine.2.ndjson"));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "engine.3.ndjson"));
}

// ═══════════════════════════════════════════════
// MetricsCollector
// ═══════════════════════════════════════════════

TEST(MetricsCollectorTest, LifecycleEvents) {
    auto sink = std::make_unique<MemorySink>();
    auto* raw = sink.get();
    MetricsCollector metrics(std::move(sink));

    metrics.record_started("python_1_deadbeef", Language::Python, 1, 5);

    Execution e;
    e.id = "python_1_deadbeef";
    e.status = ExecutionStatus::Error;
    e.failure = ErrorCode::OutputLimitExceeded;
    e.exit_code = -1;
    e.runtime = Millis{42};
    ExecutionMetrics m;
    m.output_bytes = 1024;
    metrics.record_finished(e, m);
    metrics.record_cancelled("js_2_cafebabe");
    metrics.record_evicted(3, 7);
    metrics.record_custom("engine_started", R"({"bound":5})");

    auto lines = raw->lines();
    ASSERT_EQ(lines.size(), 5u);
    EXPECT_NE(lines[0].find(R"("event":"execution_started")"), std::string::npos);
    EXPECT_NE(lines[0].find(R"("language":"python")"), std::string::npos);
    EXPECT_NE(lines[1].find(R"("status":"error")"), std::string::npos);
    EXPECT_NE(lines[1].find(R"("failure":"output_limit_exceeded")"), std::string::npos);
    EXPECT_NE(lines[1].find(R"("output_bytes":1024)"), std::string::npos);
    EXPECT_NE(lines[2].find(R"("event":"execution_cancelled")"), std::string::npos);
    EXPECT_NE(lines[3].find(R"("count":3,"remaining":7)"), std::string::npos);
    EXPECT_EQ(lines[4], R"({"event":"engine_started","data":{"bound":5}})");
}
