/**
 * @file docker_client.cpp
 * @brief DockerClient implementation: Engine API requests over AF_UNIX.
 * @author Dimitris Kafetzis
 */

#include "sandbox/docker_client.hpp"

#include <algorithm>
#include <chrono>

namespace sandbox_engine {

namespace {

using Clock = std::chrono::steady_clock;

uint32_t remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<Millis>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<uint32_t>(left) : 0;
}

bool is_success(int status) {
    return status >= 200 && status < 300;
}

/**
 * @brief Attach stream and exit-status stream of one started unit.
 */
class DockerStream : public IContainerStream {
public:
    DockerStream(UnixConnection attach, HttpResponseParser attach_parser,
                 UnixConnection wait, HttpResponseParser wait_parser)
        : attach_(std::move(attach))
        , attach_parser_(std::move(attach_parser))
        , wait_(std::move(wait))
        , wait_parser_(std::move(wait_parser)) {}

    Result<ReadStatus> read(std::string& out, Millis max_wait) override {
        auto buffered = attach_parser_.take_body();
        if (!buffered.empty()) {
            out += buffered;
            return ReadStatus::Data;
        }
        if (eof_) return ReadStatus::Eof;

        std::string raw;
        auto status = attach_.read_some(raw, static_cast<uint32_t>(std::max<int64_t>(max_wait.count(), 0)));
        if (!status) return status.error();

        switch (*status) {
            case UnixConnection::ReadStatus::TimedOut:
                return ReadStatus::Idle;
            case UnixConnection::ReadStatus::Eof: {
                eof_ = true;
                auto finished = attach_parser_.finish();
                if (!finished) return finished.error();
                auto tail = attach_parser_.take_body();
                if (tail.empty()) return ReadStatus::Eof;
                out += tail;
                return ReadStatus::Data;
            }
            case UnixConnection::ReadStatus::Data:
                break;
        }

        auto fed = attach_parser_.feed(raw);
        if (!fed) return fed.error();
        auto body = attach_parser_.take_body();
        if (body.empty()) return ReadStatus::Idle;
        out += body;
        return ReadStatus::Data;
    }

    Result<int> wait_exit(Millis timeout) override {
        auto deadline = Clock::now() + timeout;
        while (!wait_parser_.complete()) {
            uint32_t left = remaining_ms(deadline);
            if (left == 0) {
                return Error{ErrorCode::Timeout, "Timed out waiting for the unit to exit"};
            }

            std::string raw;
            auto status = wait_.read_some(raw, left);
            if (!status) return status.error();
            if (*status == UnixConnection::ReadStatus::Eof) {
                auto finished = wait_parser_.finish();
                if (!finished) return finished.error();
                break;
            }
            if (*status == UnixConnection::ReadStatus::Data) {
                auto fed = wait_parser_.feed(raw);
                if (!fed) return fed.error();
            }
        }

        auto doc = parse_json(wait_parser_.body());
        if (!doc) return doc.error();
        const auto& root = *doc;
        if (root.isMember("Error") && root["Error"].isObject()
            && !root["Error"]["Message"].asString().empty()) {
            return Error{ErrorCode::Internal, "Wait failed: " + root["Error"]["Message"].asString()};
        }
        if (!root.isMember("StatusCode")) {
            return Error{ErrorCode::Internal, "Wait response without StatusCode"};
        }
        return static_cast<int>(root["StatusCode"].asInt64());
    }

private:
    UnixConnection attach_;
    HttpResponseParser attach_parser_;
    UnixConnection wait_;
    HttpResponseParser wait_parser_;
    bool eof_ = false;
};

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

DockerClient::DockerClient(Options opts, Logger* logger)
    : opts_(std::move(opts)), logger_(logger) {}

std::string DockerClient::api_path(std::string_view path) const {
    std::string out = "/";
    out += opts_.api_version;
    out += path;
    return out;
}

// ─────────────────────────────────────────────
// IContainerRuntime
// ─────────────────────────────────────────────

Result<void> DockerClient::ping() {
    auto resp = request("GET", "/_ping", {}, opts_.request_timeout_ms);
    if (!resp) {
        return Error{ErrorCode::EnvironmentUnavailable,
                     "Container daemon unreachable: " + resp.error().message};
    }
    if (resp->status != 200) {
        return Error{ErrorCode::EnvironmentUnavailable,
                     "Container daemon ping failed: " + error_message(resp->status, resp->body)};
    }
    return Result<void>{};
}

Result<bool> DockerClient::image_present(const std::string& image) {
    auto resp = request("GET", api_path("/images/" + image + "/json"), {}, opts_.request_timeout_ms);
    if (!resp) return resp.error();
    if (resp->status == 200) return true;
    if (resp->status == 404) return false;
    return Error{ErrorCode::EnvironmentUnavailable,
                 "Image inspect failed: " + error_message(resp->status, resp->body)};
}

Result<void> DockerClient::pull_image(const std::string& image, Millis timeout) {
    auto [repo, tag] = split_image_reference(image);
    std::string target = api_path("/images/create?fromImage=" + url_encode(repo));
    if (!tag.empty()) target += "&tag=" + url_encode(tag);

    if (logger_) logger_->info("Pulling image " + image);

    auto resp = request("POST", target, {}, static_cast<uint32_t>(timeout.count()));
    if (!resp) {
        return Error{ErrorCode::EnvironmentUnavailable,
                     "Image pull failed for " + image + ": " + resp.error().message};
    }
    if (!is_success(resp->status)) {
        return Error{ErrorCode::EnvironmentUnavailable,
                     "Image pull failed for " + image + ": " + error_message(resp->status, resp->body)};
    }

    auto progress = check_pull_progress(resp->body);
    if (!progress) {
        return Error{ErrorCode::EnvironmentUnavailable,
                     "Image pull failed for " + image + ": " + progress.error().message};
    }
    if (logger_) logger_->info("Pulled image " + image);
    return Result<void>{};
}

Result<std::string> DockerClient::create_container(const ContainerSpec& spec) {
    auto resp = request("POST", api_path("/containers/create"),
                        write_json(container_create_body(spec)), opts_.request_timeout_ms);
    if (!resp) return resp.error();
    if (resp->status != 201) {
        return Error{ErrorCode::EnvironmentUnavailable,
                     "Container create failed: " + error_message(resp->status, resp->body)};
    }

    auto doc = parse_json(resp->body);
    if (!doc) return doc.error();
    auto id = (*doc)["Id"].asString();
    if (id.empty()) {
        return Error{ErrorCode::EnvironmentUnavailable, "Container create returned no id"};
    }
    return id;
}

Result<std::unique_ptr<IContainerStream>> DockerClient::start_attached(const std::string& id) {
    // Exit status first, so an auto-removed unit cannot vanish unobserved.
    HttpRequest wait_req;
    wait_req.method = "POST";
    wait_req.target = api_path("/containers/" + id + "/wait?condition=next-exit");
    auto wait = open_stream(std::move(wait_req), opts_.request_timeout_ms);
    if (!wait) return wait.error();
    if (!is_success(wait->parser.status())) {
        return Error{ErrorCode::EnvironmentUnavailable,
                     "Container wait failed: " + error_message(wait->parser.status(), wait->parser.body())};
    }

    HttpRequest attach_req;
    attach_req.method = "POST";
    attach_req.target = api_path("/containers/" + id + "/attach?stream=1&stdout=1&stderr=1");
    attach_req.headers = {{"Upgrade", "tcp"}, {"Connection", "Upgrade"}};
    auto attach = open_stream(std::move(attach_req), opts_.request_timeout_ms);
    if (!attach) return attach.error();
    int attach_status = attach->parser.status();
    if (attach_status != 101 && attach_status != 200) {
        return Error{ErrorCode::EnvironmentUnavailable,
                     "Container attach failed: " + error_message(attach_status, attach->parser.body())};
    }

    auto started = request("POST", api_path("/containers/" + id + "/start"), {}, opts_.request_timeout_ms);
    if (!started) return started.error();
    if (started->status != 204 && started->status != 304) {
        return Error{ErrorCode::EnvironmentUnavailable,
                     "Container start failed: " + error_message(started->status, started->body)};
    }

    return std::unique_ptr<IContainerStream>(std::make_unique<DockerStream>(
        std::move(attach->connection), std::move(attach->parser),
        std::move(wait->connection), std::move(wait->parser)));
}

Result<void> DockerClient::kill_container(const std::string& id) {
    auto resp = request("POST", api_path("/containers/" + id + "/kill"), {}, opts_.request_timeout_ms);
    if (!resp) return resp.error();
    // 404: already removed; 409: not running
    if (is_success(resp->status) || resp->status == 404 || resp->status == 409) {
        return Result<void>{};
    }
    return Error{ErrorCode::Internal, "Container kill failed: " + error_message(resp->status, resp->body)};
}

Result<void> DockerClient::remove_container(const std::string& id) {
    auto resp = request("DELETE", api_path("/containers/" + id + "?force=1&v=1"), {},
                        opts_.request_timeout_ms);
    if (!resp) return resp.error();
    // 409: removal already in progress (auto-remove)
    if (is_success(resp->status) || resp->status == 404 || resp->status == 409) {
        return Result<void>{};
    }
    return Error{ErrorCode::Internal, "Container remove failed: " + error_message(resp->status, resp->body)};
}

// ─────────────────────────────────────────────
// Wire Helpers
// ─────────────────────────────────────────────

Json::Value DockerClient::container_create_body(const ContainerSpec& spec) {
    Json::Value body(Json::objectValue);
    body["Image"] = spec.image;

    Json::Value cmd(Json::arrayValue);
    for (const auto& part : spec.command) cmd.append(part);
    body["Cmd"] = cmd;

    if (!spec.working_dir.empty()) body["WorkingDir"] = spec.working_dir;
    body["AttachStdin"] = false;
    body["AttachStdout"] = true;
    body["AttachStderr"] = true;
    body["OpenStdin"] = false;
    body["Tty"] = false;
    body["NetworkDisabled"] = spec.network_disabled;

    if (!spec.labels.empty()) {
        Json::Value labels(Json::objectValue);
        for (const auto& [key, value] : spec.labels) labels[key] = value;
        body["Labels"] = labels;
    }

    Json::Value host(Json::objectValue);
    if (!spec.bind_source.empty()) {
        Json::Value binds(Json::arrayValue);
        binds.append(spec.bind_source + ":" + spec.bind_target + (spec.bind_read_only ? ":ro" : ":rw"));
        host["Binds"] = binds;
    }
    if (spec.memory_bytes > 0) {
        host["Memory"] = Json::Value(static_cast<Json::Int64>(spec.memory_bytes));
        host["MemorySwap"] = Json::Value(static_cast<Json::Int64>(spec.memory_bytes));
    }
    if (spec.nano_cpus > 0) {
        host["NanoCpus"] = Json::Value(static_cast<Json::Int64>(spec.nano_cpus));
    }
    if (spec.pids_limit > 0) {
        host["PidsLimit"] = Json::Value(static_cast<Json::Int64>(spec.pids_limit));
    }
    if (spec.network_disabled) host["NetworkMode"] = "none";
    host["AutoRemove"] = spec.auto_remove;

    if (!spec.tmpfs.empty()) {
        Json::Value tmpfs(Json::objectValue);
        for (const auto& [mount, options] : spec.tmpfs) tmpfs[mount] = options;
        host["Tmpfs"] = tmpfs;
    }

    Json::Value cap_drop(Json::arrayValue);
    cap_drop.append("NET_RAW");
    cap_drop.append("SYS_CHROOT");
    cap_drop.append("MKNOD");
    host["CapDrop"] = cap_drop;

    Json::Value security(Json::arrayValue);
    security.append("no-new-privileges");
    host["SecurityOpt"] = security;

    body["HostConfig"] = host;
    return body;
}

std::pair<std::string, std::string> DockerClient::split_image_reference(const std::string& image) {
    if (image.find('@') != std::string::npos) {
        return {image, std::string{}};
    }
    auto slash = image.rfind('/');
    auto colon = image.rfind(':');
    if (colon != std::string::npos && (slash == std::string::npos || colon > slash)) {
        return {image.substr(0, colon), image.substr(colon + 1)};
    }
    return {image, "latest"};
}

Result<void> DockerClient::check_pull_progress(std::string_view progress) {
    size_t pos = 0;
    while (pos < progress.size()) {
        auto eol = progress.find('\n', pos);
        auto line = progress.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
        pos = eol == std::string_view::npos ? progress.size() : eol + 1;

        if (line.find_first_not_of(" \t\r") == std::string_view::npos) continue;
        auto doc = parse_json(line);
        if (!doc) continue;  // progress bars are informational only

        const auto& root = *doc;
        if (root.isMember("errorDetail") && root["errorDetail"].isMember("message")) {
            return Error{ErrorCode::EnvironmentUnavailable, root["errorDetail"]["message"].asString()};
        }
        if (root.isMember("error")) {
            return Error{ErrorCode::EnvironmentUnavailable, root["error"].asString()};
        }
    }
    return Result<void>{};
}

std::string DockerClient::error_message(int status, std::string_view body) {
    std::string prefix = "HTTP " + std::to_string(status);
    auto doc = parse_json(body);
    if (doc && doc->isObject() && doc->isMember("message")) {
        return prefix + ": " + (*doc)["message"].asString();
    }
    if (body.empty()) return prefix;
    return prefix + ": " + std::string(body);
}

// ─────────────────────────────────────────────
// Transport
// ─────────────────────────────────────────────

Result<DockerClient::Response> DockerClient::request(const std::string& method,
                                                     const std::string& path,
                                                     const std::string& body,
                                                     uint32_t timeout_ms) {
    HttpRequest req;
    req.method = method;
    req.target = path;
    if (!body.empty()) {
        req.headers.emplace_back("Content-Type", "application/json");
        req.body = body;
    }

    auto deadline = Clock::now() + Millis(timeout_ms);
    auto stream = open_stream(std::move(req), timeout_ms);
    if (!stream) return stream.error();

    auto& conn = stream->connection;
    auto& parser = stream->parser;
    while (!parser.complete()) {
        uint32_t left = remaining_ms(deadline);
        if (left == 0) {
            return Error{ErrorCode::EnvironmentUnavailable, method + " " + path + " timed out"};
        }

        std::string raw;
        auto status = conn.read_some(raw, left);
        if (!status) return status.error();
        if (*status == UnixConnection::ReadStatus::Eof) {
            auto finished = parser.finish();
            if (!finished) return finished.error();
            break;
        }
        if (*status == UnixConnection::ReadStatus::Data) {
            auto fed = parser.feed(raw);
            if (!fed) return fed.error();
        }
    }

    return Response{parser.status(), parser.take_body()};
}

Result<DockerClient::OpenStream> DockerClient::open_stream(HttpRequest req, uint32_t timeout_ms) {
    auto deadline = Clock::now() + Millis(timeout_ms);

    OpenStream stream;
    auto connected = stream.connection.connect(opts_.socket_path, timeout_ms);
    if (!connected) return connected.error();

    auto sent = stream.connection.send_all(req.encode(), timeout_ms);
    if (!sent) return sent.error();

    while (!stream.parser.headers_complete()) {
        uint32_t left = remaining_ms(deadline);
        if (left == 0) {
            return Error{ErrorCode::EnvironmentUnavailable,
                         req.method + " " + req.target + " timed out waiting for headers"};
        }

        std::string raw;
        auto status = stream.connection.read_some(raw, left);
        if (!status) return status.error();
        if (*status == UnixConnection::ReadStatus::Eof) {
            return Error{ErrorCode::EnvironmentUnavailable,
                         req.method + " " + req.target + ": connection closed before response"};
        }
        if (*status == UnixConnection::ReadStatus::Data) {
            auto fed = stream.parser.feed(raw);
            if (!fed) return fed.error();
        }
    }

    return stream;
}

}  // namespace sandbox_engine
