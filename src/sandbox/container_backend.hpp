/**
 * @file container_backend.hpp
 * @brief Runs compiled/toolchain languages in one ephemeral container per execution.
 * @author Dimitris Kafetzis
 *
 * Sequence per run:
 *   1. private workspace with the source under the profile's file name
 *   2. daemon probe, image pulled if absent
 *   3. unit created: workspace mounted read-only, memory/CPU/pids ceilings,
 *      no network, auto-removed on exit
 *   4. attach + start, then demultiplex output in short slices, racing
 *      end-of-stream against the deadline, cancellation and the output ceiling
 *   5. exit code on normal completion; otherwise the unit is killed and removed
 * The workspace is removed on every path.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "sandbox/backend.hpp"
#include "sandbox/container_runtime.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace sandbox_engine {

class ContainerBackend : public ISandboxBackend {
public:
    static constexpr std::string_view kStdinFile = "stdin.txt";

    struct Options {
        std::filesystem::path workspace_root = std::filesystem::temp_directory_path() / "sandbox_engine";
        uint64_t nano_cpus = 1000000000;
        int64_t pids_limit = 64;
        Millis pull_timeout{300000};
        Millis stop_grace{2000};       ///< Bound on waiting for the exit code after end-of-stream
        Millis poll_slice{25};         ///< Granularity of the deadline/cancel checks
        std::string scratch_tmpfs = "rw,exec,size=256m";
    };

    [[nodiscard]] static Options options_from(const ContainerConfig& config);

    ContainerBackend(std::unique_ptr<IContainerRuntime> runtime, Options opts, Logger& logger);

    BackendOutcome run(const BackendRequest& request) override;

    [[nodiscard]] IsolationBackend kind() const noexcept override { return IsolationBackend::Container; }
    [[nodiscard]] std::string_view name() const noexcept override { return "container"; }

    /// The unit description for a request whose workspace lives at `workspace`.
    [[nodiscard]] ContainerSpec build_spec(const BackendRequest& request,
                                           const std::filesystem::path& workspace) const;

private:
    Result<void> ensure_image(const std::string& image);

    /// Kill and force-remove; failures are logged, never returned.
    void teardown(const std::string& container_id);

    std::unique_ptr<IContainerRuntime> runtime_;
    Options opts_;
    Logger& logger_;
    std::mutex pull_mutex_;
};

}  // namespace sandbox_engine
