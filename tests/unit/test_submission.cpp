/**
 * @file test_submission.cpp
 * @brief Unit tests for submission validation, execution ids and the JSON codec.
 * @author Dimitris Kafetzis
 */

#include "core/json.hpp"
#include "orchestrator/execution_id.hpp"
#include "orchestrator/result_json.hpp"
#include "orchestrator/validation.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <regex>

using namespace sandbox_engine;

// ═══════════════════════════════════════════════
// Validation
// ═══════════════════════════════════════════════

class ValidationTest : public ::testing::Test {
protected:
    LimitsConfig limits_;

    ExecutionOptions options(std::string code = "console.log(1)") {
        ExecutionOptions o;
        o.code = std::move(code);
        return o;
    }

    ErrorCode code_of(const ExecutionOptions& o) {
        auto r = validate_submission(o, limits_);
        EXPECT_FALSE(r);
        return r ? ErrorCode::Internal : r.error().code;
    }
};

TEST_F(ValidationTest, AcceptsMinimalSubmission) {
    EXPECT_TRUE(validate_submission(options(), limits_));
}

TEST_F(ValidationTest, RejectsEmptyCode) {
    auto r = validate_submission(options(""), limits_);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ValidationFailed);
    EXPECT_EQ(r.error().message, "Code is required");
}

TEST_F(ValidationTest, CodeSizeBoundIsInclusive) {
    limits_.max_code_bytes = 10;
    EXPECT_TRUE(validate_submission(options(std::string(10, 'x')), limits_));
    EXPECT_EQ(code_of(options(std::string(11, 'x'))), ErrorCode::ValidationFailed);
}

TEST_F(ValidationTest, TimeoutBounds) {
    auto o = options();
    o.timeout_ms = limits_.min_timeout_ms;
    EXPECT_TRUE(validate_submission(o, limits_));
    o.timeout_ms = limits_.max_timeout_ms;
    EXPECT_TRUE(validate_submission(o, limits_));
    o.timeout_ms = limits_.min_timeout_ms - 1;
    EXPECT_EQ(code_of(o), ErrorCode::ValidationFailed);
    o.timeout_ms = limits_.max_timeout_ms + 1;
    EXPECT_EQ(code_of(o), ErrorCode::ValidationFailed);
}

TEST_F(ValidationTest, MemoryBounds) {
    auto o = options();
    o.memory_limit_mb = limits_.max_memory_mb;
    EXPECT_TRUE(validate_submission(o, limits_));
    o.memory_limit_mb = limits_.min_memory_mb - 1;
    auto r = validate_submission(o, limits_);
    ASSERT_FALSE(r);
    EXPECT_NE(r.error().message.find("Memory limit must be between"), std::string::npos);
}

// ═══════════════════════════════════════════════
// Execution ids
// ═══════════════════════════════════════════════

TEST(ExecutionIdTest, Sha256KnownVector) {
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(ExecutionIdTest, LayoutAndDerivation) {
    Timestamp ts{std::chrono::milliseconds{1700000000123}};
    EXPECT_EQ(make_execution_id(Language::Python, "print(1)", ts), "python_1700000000123_9e5d3ac3");
    EXPECT_EQ(make_execution_id(Language::Python, "print(1)", ts, 1), "python_1700000000123_68ceca8e");
}

TEST(ExecutionIdTest, DiffersByCodeAndTime) {
    Timestamp ts{std::chrono::milliseconds{1700000000000}};
    auto a = make_execution_id(Language::JavaScript, "a", ts);
    auto b = make_execution_id(Language::JavaScript, "b", ts);
    auto c = make_execution_id(Language::JavaScript, "a", ts + std::chrono::milliseconds{1});
    EXPECT_NE(a, b);
    EXPECT_NE(a, c);
    EXPECT_TRUE(std::regex_match(a, std::regex("javascript_[0-9]+_[0-9a-f]{8}")));
}

// ═══════════════════════════════════════════════
// JSON codec
// ═══════════════════════════════════════════════

TEST(ResultJsonTest, TimestampFormat) {
    Timestamp ts{std::chrono::milliseconds{1700000000123}};
    EXPECT_EQ(format_timestamp(ts), "2023-11-14T22:13:20.123Z");
}

TEST(ResultJsonTest, ExecutionShape) {
    Execution e;
    e.id = "python_1_abcd1234";
    e.status = ExecutionStatus::Error;
    e.failure = ErrorCode::RuntimeError;
    e.error = "Process exited with code 2";
    e.output = "oops\n";
    e.exit_code = 2;
    e.runtime = Millis{321};
    e.memory_used_bytes = 1024;
    e.language = Language::Python;
    e.timestamp = Timestamp{std::chrono::milliseconds{1700000000123}};

    auto j = to_json(e);
    EXPECT_EQ(j["id"].asString(), "python_1_abcd1234");
    EXPECT_EQ(j["status"].asString(), "error");
    EXPECT_EQ(j["failure"].asString(), "runtime_error");
    EXPECT_EQ(j["error"].asString(), "Process exited with code 2");
    EXPECT_EQ(j["output"].asString(), "oops\n");
    EXPECT_EQ(j["exitCode"].asInt(), 2);
    EXPECT_EQ(j["runtimeMs"].asInt64(), 321);
    EXPECT_EQ(j["memoryUsedBytes"].asUInt64(), 1024u);
    EXPECT_EQ(j["language"].asString(), "python");
    EXPECT_EQ(j["timestamp"].asString(), "2023-11-14T22:13:20.123Z");
}

TEST(ResultJsonTest, CompletedOmitsErrorFields) {
    Execution e;
    e.status = ExecutionStatus::Completed;
    auto j = to_json(e);
    EXPECT_FALSE(j.isMember("error"));
    EXPECT_FALSE(j.isMember("failure"));
}

TEST(ResultJsonTest, StatsShape) {
    ExecutionStats s;
    s.total = 4;
    s.timed_out = 1;
    s.avg_runtime_ms = 12.5;
    s.active = 2;
    s.max_concurrent = 5;
    auto j = to_json(s);
    EXPECT_EQ(j["total"].asUInt64(), 4u);
    EXPECT_EQ(j["timedOut"].asUInt64(), 1u);
    EXPECT_DOUBLE_EQ(j["avgRuntimeMs"].asDouble(), 12.5);
    EXPECT_EQ(j["activeExecutions"].asUInt64(), 2u);
    EXPECT_EQ(j["maxConcurrent"].asUInt64(), 5u);
}

TEST(ResultJsonTest, CatalogShape) {
    auto j = to_json(LanguageCatalog::instance().profiles());
    ASSERT_TRUE(j.isArray());
    ASSERT_EQ(j.size(), 8u);
    EXPECT_EQ(j[0]["language"].asString(), "javascript");
    EXPECT_EQ(j[0]["backend"].asString(), "in_process");
    EXPECT_FALSE(j[0].isMember("image"));
}

TEST(ResultJsonTest, DecodeFullSubmission) {
    auto doc = parse_json(R"json({"code":"print(input())","language":"py","timeout":5000,
                              "memoryLimitMb":128,"input":"abc"})json");
    ASSERT_TRUE(doc);
    auto o = options_from_json(*doc);
    ASSERT_TRUE(o) << o.error().message;
    EXPECT_EQ(o->code, "print(input())");
    EXPECT_EQ(o->language, Language::Python);
    EXPECT_EQ(o->timeout_ms, 5000u);
    EXPECT_EQ(o->memory_limit_mb, 128u);
    EXPECT_EQ(o->input, "abc");
}

TEST(ResultJsonTest, DecodeMinimalSubmission) {
    auto doc = parse_json(R"({"code":"1","language":"javascript","input":null})");
    ASSERT_TRUE(doc);
    auto o = options_from_json(*doc);
    ASSERT_TRUE(o);
    EXPECT_FALSE(o->timeout_ms.has_value());
    EXPECT_FALSE(o->memory_limit_mb.has_value());
    EXPECT_FALSE(o->input.has_value());
}

TEST(ResultJsonTest, DecodeRejectsBadShapes) {
    auto decode = [](const char* text) {
        auto doc = parse_json(text);
        EXPECT_TRUE(doc) << text;
        auto o = options_from_json(*doc);
        EXPECT_FALSE(o) << text;
        return o ? ErrorCode::Internal : o.error().code;
    };
    EXPECT_EQ(decode(R"([1,2])"), ErrorCode::ValidationFailed);
    EXPECT_EQ(decode(R"({"language":"js"})"), ErrorCode::ValidationFailed);
    EXPECT_EQ(decode(R"({"code":42,"language":"js"})"), ErrorCode::ValidationFailed);
    EXPECT_EQ(decode(R"({"code":"x","language":"js","timeout":-5})"), ErrorCode::ValidationFailed);
    EXPECT_EQ(decode(R"({"code":"x","language":"js","timeout":"fast"})"), ErrorCode::ValidationFailed);
    EXPECT_EQ(decode(R"({"code":"x","language":"js","input":7})"), ErrorCode::ValidationFailed);
    EXPECT_EQ(decode(R"({"code":"x","language":"brainfuck"})"), ErrorCode::UnsupportedLanguage);
}

TEST(JsonTest, ParseErrorIsValidationFailed) {
    auto r = parse_json("{not json");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ValidationFailed);
}

TEST(JsonTest, CompactWriterIsSingleLine) {
    Json::Value v(Json::objectValue);
    v["a"] = 1;
    v["b"] = "two";
    auto text = write_json(v);
    EXPECT_EQ(text.find('\n'), std::string::npos);
    EXPECT_EQ(text, R"({"a":1,"b":"two"})");
}
