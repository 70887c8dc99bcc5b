/**
 * @file docker_client.hpp
 * @brief IContainerRuntime over the Docker Engine HTTP API on a unix socket.
 * @author Dimitris Kafetzis
 *
 * Every request uses its own connection ("Connection: close"). Attach and
 * wait are long-lived streams opened before the unit is started, so no
 * output or exit status can be missed when the unit removes itself.
 */

#pragma once

#include "core/json.hpp"
#include "core/logger.hpp"
#include "network/http_codec.hpp"
#include "network/unix_transport.hpp"
#include "sandbox/container_runtime.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace sandbox_engine {

class DockerClient : public IContainerRuntime {
public:
    struct Options {
        std::string socket_path = "/var/run/docker.sock";
        std::string api_version = "v1.41";
        uint32_t request_timeout_ms = 10000;
    };

    explicit DockerClient(Options opts, Logger* logger = nullptr);

    Result<void> ping() override;
    Result<bool> image_present(const std::string& image) override;
    Result<void> pull_image(const std::string& image, Millis timeout) override;
    Result<std::string> create_container(const ContainerSpec& spec) override;
    Result<std::unique_ptr<IContainerStream>> start_attached(const std::string& id) override;
    Result<void> kill_container(const std::string& id) override;
    Result<void> remove_container(const std::string& id) override;

    // ── Wire helpers (exposed for tests) ─────

    /// Request body for POST /containers/create.
    [[nodiscard]] static Json::Value container_create_body(const ContainerSpec& spec);

    /// "repo[:tag]" -> {repo, tag}; tag defaults to "latest", empty for digests.
    [[nodiscard]] static std::pair<std::string, std::string> split_image_reference(const std::string& image);

    /// Scan an image-pull progress stream (one JSON object per line) for an error.
    [[nodiscard]] static Result<void> check_pull_progress(std::string_view progress);

    /// The "message" field of a daemon error body, or the raw body.
    [[nodiscard]] static std::string error_message(int status, std::string_view body);

private:
    struct Response {
        int status = 0;
        std::string body;
    };

    /// An open connection whose response headers have been read.
    struct OpenStream {
        UnixConnection connection;
        HttpResponseParser parser;
    };

    [[nodiscard]] std::string api_path(std::string_view path) const;

    Result<Response> request(const std::string& method, const std::string& path,
                             const std::string& body, uint32_t timeout_ms);
    Result<OpenStream> open_stream(HttpRequest req, uint32_t timeout_ms);

    Options opts_;
    Logger* logger_;
};

}  // namespace sandbox_engine
