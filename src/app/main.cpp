/**
 * @file main.cpp
 * @brief SandboxEngine command-line entry point.
 * @author Dimitris Kafetzis
 *
 * Wires the modules into a single-shot run:
 *   Config → Logger → Orchestrator → submit → wait → JSON result on stdout
 */

#include "core/config.hpp"
#include "core/json.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "orchestrator/orchestrator.hpp"
#include "orchestrator/result_json.hpp"
#include "telemetry/json_sink.hpp"

#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

using namespace sandbox_engine;

namespace {

volatile std::sig_atomic_t g_cancel_requested = 0;

void signal_handler(int /*signal*/) {
    g_cancel_requested = 1;
}

void print_banner() {
    std::cerr << R"(
  ╔═══════════════════════════════════════════╗
  ║           SandboxEngine v1.0.0            ║
  ║   Isolated execution of untrusted code    ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::optional<std::filesystem::path> config_path;
    std::string language = "javascript";
    std::optional<std::filesystem::path> file;
    std::optional<std::string> request_json;
    std::optional<uint32_t> timeout_ms;
    std::optional<uint32_t> memory_mb;
    std::optional<std::string> input;
    std::string log_dir;
    std::string log_level;
    bool list_languages = false;
    bool show_stats = false;
};

void print_usage() {
    std::cout << "Usage: sandbox_engine [OPTIONS]\n"
              << "  --config <path>      Configuration file (TOML)\n"
              << "  --language <tag>     Source language (default: javascript)\n"
              << "  --file <path>        Source file (default: read stdin)\n"
              << "  --request <json>     Full submission as JSON; overrides the options above\n"
              << "  --timeout <ms>       Wall-clock limit\n"
              << "  --memory <mb>        Memory limit\n"
              << "  --input <text>       Data made available to the program as stdin\n"
              << "  --log-dir <path>     Write NDJSON logs there instead of stdout\n"
              << "  --log-level <level>  debug | info | warn | error\n"
              << "  --list-languages     Print the language catalog and exit\n"
              << "  --stats              Print engine statistics after the run\n"
              << "  --help, -h           Show this help message\n";
}

std::optional<uint32_t> parse_u32(const std::string& text) {
    try {
        size_t consumed = 0;
        unsigned long value = std::stoul(text, &consumed);
        if (consumed != text.size() || value > UINT32_MAX) return std::nullopt;
        return static_cast<uint32_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        if (arg == "--config" && has_value) {
            args.config_path = argv[++i];
        } else if (arg == "--language" && has_value) {
            args.language = argv[++i];
        } else if (arg == "--file" && has_value) {
            args.file = argv[++i];
        } else if (arg == "--request" && has_value) {
            args.request_json = argv[++i];
        } else if ((arg == "--timeout" || arg == "--memory") && has_value) {
            auto value = parse_u32(argv[++i]);
            if (!value) {
                return Error{ErrorCode::ValidationFailed, arg + " expects a positive integer"};
            }
            (arg == "--timeout" ? args.timeout_ms : args.memory_mb) = *value;
        } else if (arg == "--input" && has_value) {
            args.input = argv[++i];
        } else if (arg == "--log-dir" && has_value) {
            args.log_dir = argv[++i];
        } else if (arg == "--log-level" && has_value) {
            args.log_level = argv[++i];
        } else if (arg == "--list-languages") {
            args.list_languages = true;
        } else if (arg == "--stats") {
            args.show_stats = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            return Error{ErrorCode::ValidationFailed, "Unknown or incomplete option: " + arg};
        }
    }
    return args;
}

Result<std::string> read_source(const CLIArgs& args) {
    if (args.file) {
        std::ifstream in(*args.file, std::ios::binary);
        if (!in) {
            return Error{ErrorCode::ValidationFailed, "Cannot open " + args.file->string()};
        }
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    std::ostringstream buffer;
    buffer << std::cin.rdbuf();
    return buffer.str();
}

Result<ExecutionOptions> build_submission(const CLIArgs& args) {
    if (args.request_json) {
        auto doc = parse_json(*args.request_json);
        if (!doc) return doc.error();
        return options_from_json(*doc);
    }

    auto language = parse_language(args.language);
    if (!language) return language.error();

    auto code = read_source(args);
    if (!code) return code.error();

    ExecutionOptions options;
    options.code = std::move(*code);
    options.language = *language;
    options.timeout_ms = args.timeout_ms;
    options.memory_limit_mb = args.memory_mb;
    options.input = args.input;
    return options;
}

Result<Config> resolve_config(const CLIArgs& args) {
    Config config = default_config();
    if (args.config_path) {
        auto loaded = load_config(*args.config_path);
        if (!loaded) return loaded.error();
        config = std::move(*loaded);
    }
    if (auto env = apply_env_overrides(config); !env) return env.error();

    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (!args.log_level.empty()) config.telemetry.log_level = args.log_level;

    if (auto valid = validate_config(config); !valid) return valid.error();
    return config;
}

/// Upper bound on how long the CLI waits before cancelling on its own.
Millis wait_ceiling(const Config& config, const ExecutionOptions& options) {
    Millis timeout{options.timeout_ms.value_or(config.engine.default_timeout_ms)};
    return timeout + Millis{config.container.pull_timeout_ms} + Millis{config.container.stop_grace_ms}
           + Millis{5000};
}

int fail(const Error& error) {
    std::cerr << "error: " << error.message << std::endl;
    return 2;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return fail(args.error());
    }

    if (args->list_languages) {
        std::cout << write_json_pretty(to_json(LanguageCatalog::instance().profiles())) << std::endl;
        return 0;
    }

    print_banner();

    auto config = resolve_config(*args);
    if (!config) return fail(config.error());

    auto submission = build_submission(*args);
    if (!submission) return fail(submission.error());

    // ── Initialize Orchestrator ──────────────
    Orchestrator::Options opts;
    opts.config = *config;
    opts.log_level = parse_log_level(config->telemetry.log_level).value_or(LogLevel::Info);
    if (!config->telemetry.log_dir.empty()) {
        opts.log_sink = std::make_unique<JsonFileSink>(config->telemetry.log_dir, "sandbox_engine",
            config->telemetry.max_file_size_mb, config->telemetry.rotate_count);
        opts.metrics_sink = std::make_unique<JsonFileSink>(config->telemetry.log_dir, "metrics",
            config->telemetry.max_file_size_mb, config->telemetry.rotate_count);
    }

    Orchestrator orchestrator(std::move(opts));
    if (auto started = orchestrator.start(); !started) return fail(started.error());

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const auto ceiling = wait_ceiling(*config, *submission);
    auto id = orchestrator.submit(std::move(*submission));
    if (!id) {
        orchestrator.stop();
        return fail(id.error());
    }

    // ── Wait for a terminal record ───────────
    const auto deadline = std::chrono::steady_clock::now() + ceiling;
    bool cancel_sent = false;
    Result<Execution> record = orchestrator.wait(*id, Millis{100});
    while (record && !is_terminal(record->status)) {
        bool out_of_time = std::chrono::steady_clock::now() >= deadline;
        if ((g_cancel_requested || out_of_time) && !cancel_sent) {
            orchestrator.logger().warn(out_of_time ? "Wait ceiling reached, cancelling " + *id
                                                   : "Interrupted, cancelling " + *id);
            if (auto cancelled = orchestrator.cancel(*id); !cancelled) {
                orchestrator.logger().error(cancelled.error().message);
            }
            cancel_sent = true;
        }
        record = orchestrator.wait(*id, Millis{100});
    }

    // Let the backend finish so the record carries its final output
    orchestrator.stop();
    record = orchestrator.get_result(*id);
    if (!record) return fail(record.error());

    std::cout << write_json_pretty(to_json(*record)) << std::endl;
    if (args->show_stats) {
        std::cout << write_json_pretty(to_json(orchestrator.stats())) << std::endl;
    }
    return record->status == ExecutionStatus::Completed ? 0 : 1;
}
