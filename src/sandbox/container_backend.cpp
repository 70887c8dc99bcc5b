/**
 * @file container_backend.cpp
 * @brief ContainerBackend implementation.
 * @author Dimitris Kafetzis
 */

#include "sandbox/container_backend.hpp"

#include "governor/output_governor.hpp"
#include "sandbox/stream_demux.hpp"
#include "sandbox/workspace.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <optional>
#include <vector>

namespace sandbox_engine {

namespace {

using Clock = std::chrono::steady_clock;

std::string short_id(const std::string& container_id) {
    return container_id.substr(0, 12);
}

/**
 * @brief Tears the unit down unless released after a clean exit.
 */
class UnitGuard {
public:
    using Teardown = std::function<void(const std::string&)>;

    UnitGuard(std::string id, Teardown teardown)
        : id_(std::move(id)), teardown_(std::move(teardown)) {}
    ~UnitGuard() {
        if (armed_) teardown_(id_);
    }

    UnitGuard(const UnitGuard&) = delete;
    UnitGuard& operator=(const UnitGuard&) = delete;

    void release() noexcept { armed_ = false; }

private:
    std::string id_;
    Teardown teardown_;
    bool armed_ = true;
};

}  // anonymous namespace

ContainerBackend::Options ContainerBackend::options_from(const ContainerConfig& config) {
    Options opts;
    opts.workspace_root = config.workspace_root;
    opts.nano_cpus = config.nano_cpus;
    opts.pids_limit = config.pids_limit;
    opts.pull_timeout = Millis(config.pull_timeout_ms);
    opts.stop_grace = Millis(config.stop_grace_ms);
    return opts;
}

ContainerBackend::ContainerBackend(std::unique_ptr<IContainerRuntime> runtime,
                                   Options opts, Logger& logger)
    : runtime_(std::move(runtime)), opts_(std::move(opts)), logger_(logger) {}

ContainerSpec ContainerBackend::build_spec(const BackendRequest& request,
                                           const std::filesystem::path& workspace) const {
    const auto& profile = *request.profile;

    std::optional<std::string> stdin_file;
    if (request.options.input) stdin_file = std::string(kStdinFile);

    ContainerSpec spec;
    spec.image = profile.image;
    spec.command = {"/bin/sh", "-c", LanguageCatalog::entry_command(profile, stdin_file)};
    spec.working_dir = std::string(LanguageCatalog::kSourceDir);
    spec.bind_source = workspace.string();
    spec.bind_target = std::string(LanguageCatalog::kSourceDir);
    spec.bind_read_only = true;
    spec.memory_bytes = request.limits.memory_limit_bytes;
    spec.nano_cpus = opts_.nano_cpus;
    spec.pids_limit = opts_.pids_limit;
    spec.network_disabled = true;
    spec.auto_remove = true;
    spec.tmpfs["/tmp"] = opts_.scratch_tmpfs;
    spec.labels["sandbox_engine.execution"] = request.id;
    return spec;
}

BackendOutcome ContainerBackend::run(const BackendRequest& request) {
    const auto& profile = *request.profile;
    const uint64_t memory = request.limits.memory_limit_bytes;

    // ── Workspace ────────────────────────────
    auto workspace = Workspace::create(opts_.workspace_root, request.id, &logger_);
    if (!workspace) {
        return BackendOutcome::failed(ErrorCode::Internal, workspace.error().message);
    }
    if (auto src = workspace->write_file(profile.naming.file_name, request.options.code); !src) {
        return BackendOutcome::failed(ErrorCode::Internal, src.error().message);
    }
    if (request.options.input) {
        if (auto in = workspace->write_file(kStdinFile, *request.options.input); !in) {
            return BackendOutcome::failed(ErrorCode::Internal, in.error().message);
        }
    }

    // ── Environment ──────────────────────────
    if (auto ping = runtime_->ping(); !ping) {
        return BackendOutcome::failed(ErrorCode::EnvironmentUnavailable, ping.error().message);
    }
    if (auto image = ensure_image(profile.image); !image) {
        return BackendOutcome::failed(ErrorCode::EnvironmentUnavailable, image.error().message);
    }
    if (request.stop.stop_requested()) {
        return BackendOutcome::failed(ErrorCode::Cancelled, "Execution cancelled");
    }

    // ── Unit ─────────────────────────────────
    auto created = runtime_->create_container(build_spec(request, workspace->path()));
    if (!created) {
        return BackendOutcome::failed(ErrorCode::EnvironmentUnavailable, created.error().message);
    }
    const std::string container_id = *created;
    UnitGuard guard(container_id, [this](const std::string& id) { teardown(id); });
    logger_.debug("Unit " + short_id(container_id) + " created for " + request.id
                  + " (" + profile.image + ")");

    auto stream = runtime_->start_attached(container_id);
    if (!stream) {
        return BackendOutcome::failed(ErrorCode::EnvironmentUnavailable, stream.error().message);
    }

    // ── Output race ──────────────────────────
    // The timeout covers the program only; provisioning is bounded by the
    // pull timeout and the runtime's request timeouts.
    const auto deadline = Clock::now() + request.limits.timeout;
    OutputGovernor governor(request.limits.max_output_bytes);
    StreamDemuxer demux;
    std::vector<StreamFrame> frames;
    std::string raw;
    std::optional<ErrorCode> abort;
    std::string stream_error;

    for (;;) {
        if (request.stop.stop_requested()) {
            abort = ErrorCode::Cancelled;
            break;
        }
        auto now = Clock::now();
        if (now >= deadline) {
            abort = ErrorCode::Timeout;
            break;
        }
        auto slice = std::min(opts_.poll_slice, std::chrono::duration_cast<Millis>(deadline - now));

        raw.clear();
        auto status = (*stream)->read(raw, slice);
        if (!status) {
            abort = ErrorCode::Internal;
            stream_error = status.error().message;
            break;
        }

        if (!raw.empty()) {
            frames.clear();
            if (auto fed = demux.feed(raw, frames); !fed) {
                abort = ErrorCode::Internal;
                stream_error = fed.error().message;
                break;
            }
            for (const auto& frame : frames) {
                if (frame.channel == StreamChannel::Stdin) continue;
                auto accepted = governor.append(frame.payload);
                if (!accepted.empty() && request.on_output) request.on_output(accepted);
                if (governor.exceeded()) break;
            }
            if (governor.exceeded()) {
                abort = ErrorCode::OutputLimitExceeded;
                break;
            }
        }

        if (*status == IContainerStream::ReadStatus::Eof) break;
    }

    if (abort) {
        // Guard destruction kills and removes the unit.
        switch (*abort) {
            case ErrorCode::Timeout:
                return BackendOutcome::failed(ErrorCode::Timeout,
                    "Execution timed out after " + std::to_string(request.limits.timeout.count()) + "ms",
                    governor.take(), -1, memory);
            case ErrorCode::OutputLimitExceeded:
                return BackendOutcome::failed(ErrorCode::OutputLimitExceeded,
                    "Output exceeded " + std::to_string(governor.ceiling()) + " bytes",
                    governor.take(), -1, memory);
            case ErrorCode::Cancelled:
                return BackendOutcome::failed(ErrorCode::Cancelled, "Execution cancelled",
                                              governor.take(), -1, memory);
            default:
                return BackendOutcome::failed(ErrorCode::Internal, "Output stream failed: " + stream_error,
                                              governor.take(), -1, memory);
        }
    }

    // ── Exit status ──────────────────────────
    auto exit_code = (*stream)->wait_exit(opts_.stop_grace);
    if (!exit_code) {
        logger_.warn("No exit status for unit " + short_id(container_id) + ": " + exit_code.error().message);
        return BackendOutcome::failed(ErrorCode::Internal,
                                      "Could not retrieve exit code: " + exit_code.error().message,
                                      governor.take(), -1, memory);
    }

    // The unit removes itself after a clean exit.
    guard.release();

    if (*exit_code == 0) {
        return BackendOutcome::completed(governor.take(), 0, memory);
    }
    return BackendOutcome::failed(ErrorCode::RuntimeError,
                                  "Process exited with code " + std::to_string(*exit_code),
                                  governor.take(), *exit_code, memory);
}

Result<void> ContainerBackend::ensure_image(const std::string& image) {
    std::lock_guard lock(pull_mutex_);

    auto present = runtime_->image_present(image);
    if (!present) return present.error();
    if (*present) return Result<void>{};

    logger_.info("Image " + image + " not present locally, fetching");
    return runtime_->pull_image(image, opts_.pull_timeout);
}

void ContainerBackend::teardown(const std::string& container_id) {
    if (auto killed = runtime_->kill_container(container_id); !killed) {
        logger_.warn("Kill failed for unit " + short_id(container_id) + ": " + killed.error().message);
    }
    if (auto removed = runtime_->remove_container(container_id); !removed) {
        logger_.warn("Remove failed for unit " + short_id(container_id) + ": " + removed.error().message);
    }
}

}  // namespace sandbox_engine
