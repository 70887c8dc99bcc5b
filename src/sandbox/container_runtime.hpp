/**
 * @file container_runtime.hpp
 * @brief IContainerRuntime: what the container backend needs from a daemon.
 * @author Dimitris Kafetzis
 *
 * DockerClient is the production implementation; tests script a fake.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sandbox_engine {

/**
 * @brief Everything needed to create one ephemeral unit.
 */
struct ContainerSpec {
    std::string image;
    std::vector<std::string> command;
    std::string working_dir;
    std::string bind_source;               ///< Host directory
    std::string bind_target;               ///< Mount point inside the unit
    bool bind_read_only = true;
    uint64_t memory_bytes = 0;             ///< Hard ceiling; swap disabled
    uint64_t nano_cpus = 0;
    int64_t pids_limit = 0;                ///< 0 = daemon default
    bool network_disabled = true;
    bool auto_remove = true;
    std::map<std::string, std::string> tmpfs;   ///< mount point -> options
    std::map<std::string, std::string> labels;
};

/**
 * @brief A started unit's attached output and exit status.
 */
class IContainerStream {
public:
    enum class ReadStatus : uint8_t {
        Data,   ///< Raw multiplexed bytes were appended
        Eof,    ///< The unit closed its output
        Idle    ///< Nothing arrived within the wait
    };

    virtual ~IContainerStream() = default;

    /// Append raw (still framed) bytes to `out`, waiting at most `max_wait`.
    virtual Result<ReadStatus> read(std::string& out, Millis max_wait) = 0;

    /// Exit code once the unit has stopped.
    virtual Result<int> wait_exit(Millis timeout) = 0;
};

class IContainerRuntime {
public:
    virtual ~IContainerRuntime() = default;

    /// Daemon reachability probe.
    virtual Result<void> ping() = 0;

    virtual Result<bool> image_present(const std::string& image) = 0;
    virtual Result<void> pull_image(const std::string& image, Millis timeout) = 0;

    /// Returns the new unit's id.
    virtual Result<std::string> create_container(const ContainerSpec& spec) = 0;

    /// Attach to output, then start. Output produced before attach is never lost.
    virtual Result<std::unique_ptr<IContainerStream>> start_attached(const std::string& id) = 0;

    virtual Result<void> kill_container(const std::string& id) = 0;

    /// Force-remove; a unit that is already gone is not an error.
    virtual Result<void> remove_container(const std::string& id) = 0;
};

}  // namespace sandbox_engine
