/**
 * @file v8_backend.cpp
 * @brief V8Backend implementation.
 * @author Dimitris Kafetzis
 */

#include "sandbox/v8_backend.hpp"

#include "executor/deadline_timer.hpp"
#include "governor/output_governor.hpp"

#include <libplatform/libplatform.h>
#include <v8.h>

#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>

namespace sandbox_engine {

namespace {

std::once_flag g_init_once;
std::unique_ptr<v8::Platform> g_platform;

struct RunState;

/// `data` of one console method.
struct ConsoleChannel {
    RunState* state = nullptr;
    const char* method = "";
    std::string_view prefix;
};

/**
 * @brief Everything the callbacks of one run share.
 *
 * Flags written by the timer thread or the heap callback are atomic; the
 * rest is touched only from the isolate's thread.
 */
struct RunState {
    explicit RunState(const BackendRequest& req)
        : request(req), governor(req.limits.max_output_bytes) {}

    const BackendRequest& request;
    v8::Isolate* isolate = nullptr;
    OutputGovernor governor;
    bool output_exceeded = false;
    std::atomic<bool> heap_exhausted{false};
    std::atomic<bool> timed_out{false};
    std::atomic<bool> cancelled{false};
    std::atomic<bool> settled{false};  ///< Claimed by whichever ends the run first
    std::array<ConsoleChannel, 5> channels{};
};

struct IsolateDeleter {
    void operator()(v8::Isolate* isolate) const { isolate->Dispose(); }
};
using IsolatePtr = std::unique_ptr<v8::Isolate, IsolateDeleter>;

v8::MaybeLocal<v8::String> make_string(v8::Isolate* isolate, std::string_view text) {
    return v8::String::NewFromUtf8(isolate, text.data(), v8::NewStringType::kNormal,
                                   static_cast<int>(text.size()));
}

std::string to_utf8(v8::Isolate* isolate, v8::Local<v8::Value> value) {
    v8::String::Utf8Value text(isolate, value);
    if (*text == nullptr) return "[unprintable]";
    return std::string(*text, static_cast<size_t>(text.length()));
}

/// String(arg) for primitives and functions, JSON.stringify(arg, null, 2) for objects.
std::string render_value(v8::Isolate* isolate, v8::Local<v8::Context> context,
                         v8::Local<v8::Value> value) {
    v8::TryCatch try_catch(isolate);

    if (value->IsObject() && !value->IsFunction()) {
        v8::Local<v8::String> json;
        if (v8::JSON::Stringify(context, value, v8::String::NewFromUtf8Literal(isolate, "  ")).ToLocal(&json)
            && !json->IsUndefined()) {
            return to_utf8(isolate, json);
        }
        if (try_catch.HasTerminated()) {
            try_catch.ReThrow();
            return {};
        }
        try_catch.Reset();   // circular structure and friends: fall back to String()
    }

    auto text = to_utf8(isolate, value);
    if (try_catch.HasTerminated()) try_catch.ReThrow();
    return text;
}

void console_write(const v8::FunctionCallbackInfo<v8::Value>& info) {
    auto* channel = static_cast<ConsoleChannel*>(info.Data().As<v8::External>()->Value());
    RunState& state = *channel->state;
    v8::Isolate* isolate = info.GetIsolate();

    if (state.output_exceeded) {
        isolate->TerminateExecution();
        return;
    }

    v8::HandleScope scope(isolate);
    auto context = isolate->GetCurrentContext();

    std::string line(channel->prefix);
    for (int i = 0; i < info.Length(); ++i) {
        if (i > 0 || !line.empty()) line += ' ';
        line += render_value(isolate, context, info[i]);
        if (isolate->IsExecutionTerminating()) return;
    }
    line += '\n';

    auto accepted = state.governor.append(line);
    if (!accepted.empty() && state.request.on_output) state.request.on_output(accepted);
    if (state.governor.exceeded()) {
        state.output_exceeded = true;
        isolate->TerminateExecution();
    }
}

size_t on_near_heap_limit(void* data, size_t current_heap_limit, size_t /*initial_heap_limit*/) {
    auto* state = static_cast<RunState*>(data);
    state->heap_exhausted = true;
    state->isolate->TerminateExecution();
    // Headroom so the termination can unwind instead of a fatal OOM
    return current_heap_limit * 2;
}

v8::Local<v8::Context> create_context(RunState& state) {
    v8::Isolate* isolate = state.isolate;

    state.channels = {{
        {&state, "log", ""},
        {&state, "info", "[INFO]"},
        {&state, "warn", "[WARN]"},
        {&state, "error", "[ERROR]"},
        {&state, "debug", ""},
    }};

    auto console = v8::ObjectTemplate::New(isolate);
    for (auto& channel : state.channels) {
        console->Set(isolate, channel.method,
                     v8::FunctionTemplate::New(isolate, console_write, v8::External::New(isolate, &channel)));
    }

    auto global = v8::ObjectTemplate::New(isolate);
    global->Set(isolate, "console", console);

    return v8::Context::New(isolate, nullptr, global);
}

std::string describe_exception(v8::Isolate* isolate, v8::Local<v8::Context> context,
                               const v8::TryCatch& try_catch) {
    if (try_catch.HasTerminated()) return "Execution terminated";

    std::string text = to_utf8(isolate, try_catch.Exception());
    auto message = try_catch.Message();
    if (!message.IsEmpty()) {
        int line = message->GetLineNumber(context).FromMaybe(0);
        if (line > 0) text += " (line " + std::to_string(line) + ")";
    }
    return text;
}

/**
 * @brief Compile and run the wrapped code.
 * @return The error text if the code failed, std::nullopt otherwise.
 */
std::optional<std::string> execute(RunState& state, v8::Local<v8::Context> context) {
    v8::Isolate* isolate = state.isolate;
    const auto& options = state.request.options;
    v8::TryCatch try_catch(isolate);

    if (options.input) {
        v8::Local<v8::String> input;
        if (!make_string(isolate, *options.input).ToLocal(&input)) {
            return std::string("Input is too large");
        }
        auto attrs = static_cast<v8::PropertyAttribute>(v8::ReadOnly | v8::DontDelete);
        if (!context->Global()
                 ->DefineOwnProperty(context, v8::String::NewFromUtf8Literal(isolate, "input"), input, attrs)
                 .FromMaybe(false)) {
            return std::string("Cannot expose input");
        }
    }

    // Async wrapper: top-level await works and a throw becomes a rejection.
    std::string wrapped = "(async function() {\n" + options.code + "\n})()";
    v8::Local<v8::String> source;
    if (!make_string(isolate, wrapped).ToLocal(&source)) {
        return std::string("Source is too large");
    }

    v8::ScriptOrigin origin(isolate, v8::String::NewFromUtf8Literal(isolate, "main.js"), -1);
    v8::Local<v8::Script> script;
    if (!v8::Script::Compile(context, source, &origin).ToLocal(&script)) {
        return describe_exception(isolate, context, try_catch);
    }

    v8::Local<v8::Value> result;
    if (!script->Run(context).ToLocal(&result)) {
        return describe_exception(isolate, context, try_catch);
    }

    isolate->PerformMicrotaskCheckpoint();
    if (try_catch.HasCaught()) {
        return describe_exception(isolate, context, try_catch);
    }

    if (result->IsPromise()) {
        auto promise = result.As<v8::Promise>();
        if (promise->State() == v8::Promise::kRejected) {
            return to_utf8(isolate, promise->Result());
        }
    }
    return std::nullopt;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// V8Backend
// ─────────────────────────────────────────────

V8Backend::V8Backend(Logger& logger) : logger_(logger) {
    initialize();
}

void V8Backend::initialize() {
    std::call_once(g_init_once, [] {
        v8::V8::SetFlagsFromString("--no-expose-wasm");
        g_platform = v8::platform::NewDefaultPlatform();
        v8::V8::InitializePlatform(g_platform.get());
        v8::V8::Initialize();
    });
}

std::string V8Backend::engine_version() {
    return v8::V8::GetVersion();
}

BackendOutcome V8Backend::run(const BackendRequest& request) {
    const auto& profile = *request.profile;
    if (profile.requires_transpile) {
        return BackendOutcome::failed(ErrorCode::UnsupportedLanguage,
            std::string(to_string(profile.language)) + " requires a transpile step that is not available",
            {}, 1);
    }
    if (profile.language != Language::JavaScript) {
        return BackendOutcome::failed(ErrorCode::UnsupportedLanguage,
            "In-process backend cannot run " + std::string(to_string(profile.language)), {}, 1);
    }

    initialize();

    // Declared before the isolate so it outlives every callback.
    RunState state(request);

    std::unique_ptr<v8::ArrayBuffer::Allocator> allocator(v8::ArrayBuffer::Allocator::NewDefaultAllocator());
    v8::Isolate::CreateParams params;
    params.array_buffer_allocator = allocator.get();
    params.constraints.ConfigureDefaultsFromHeapSize(0, request.limits.memory_limit_bytes);

    IsolatePtr isolate(v8::Isolate::New(params));
    if (!isolate) {
        return BackendOutcome::failed(ErrorCode::Internal, "Failed to create V8 isolate");
    }
    state.isolate = isolate.get();
    isolate->AddNearHeapLimitCallback(on_near_heap_limit, &state);
    isolate->SetMicrotasksPolicy(v8::MicrotasksPolicy::kExplicit);

    std::optional<std::string> script_error;
    uint64_t heap_used = 0;
    {
        v8::Isolate::Scope isolate_scope(isolate.get());
        v8::HandleScope handle_scope(isolate.get());

        auto context = create_context(state);
        v8::Context::Scope context_scope(context);
        context->AllowCodeGenerationFromStrings(false);

        DeadlineTimer timer(request.limits.timeout, request.stop, [&state](DeadlineTimer::Reason reason) {
            if (state.settled.exchange(true)) return;
            if (reason == DeadlineTimer::Reason::Deadline) {
                state.timed_out = true;
            } else {
                state.cancelled = true;
            }
            state.isolate->TerminateExecution();
        });

        script_error = execute(state, context);
        // A deadline that fires after this point finds the run settled.
        state.settled = true;
        timer.disarm();

        v8::HeapStatistics stats;
        isolate->GetHeapStatistics(&stats);
        heap_used = stats.used_heap_size();
    }

    logger_.debug("Isolate for " + request.id + " released, heap used " + std::to_string(heap_used) + " bytes");

    auto output = state.governor.take();
    if (state.cancelled) {
        return BackendOutcome::failed(ErrorCode::Cancelled, "Execution cancelled",
                                      std::move(output), -1, heap_used);
    }
    if (state.timed_out) {
        return BackendOutcome::failed(ErrorCode::Timeout,
            "Execution timed out after " + std::to_string(request.limits.timeout.count()) + "ms",
            std::move(output), -1, heap_used);
    }
    if (state.output_exceeded) {
        return BackendOutcome::failed(ErrorCode::OutputLimitExceeded,
            "Output exceeded " + std::to_string(request.limits.max_output_bytes) + " bytes",
            std::move(output), -1, heap_used);
    }
    if (state.heap_exhausted) {
        return BackendOutcome::failed(ErrorCode::MemoryLimitExceeded,
            "Memory limit of " + std::to_string(request.limits.memory_limit_bytes / (1024 * 1024))
                + " MB exceeded",
            std::move(output), -1, heap_used);
    }
    if (script_error) {
        return BackendOutcome::failed(ErrorCode::RuntimeError, *script_error, std::move(output), 1, heap_used);
    }
    return BackendOutcome::completed(std::move(output), 0, heap_used);
}

}  // namespace sandbox_engine
