#include "gateway/tool_gateway.hpp"

#include <algorithm>
#include <chrono>
#include <limits>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/envelope_codec.hpp"

namespace hostbridge::gateway {

using core::errors::BridgeError;
using core::errors::ErrorKind;
using nlohmann::json;

namespace {

int clamp_timeout(const std::int64_t remaining_ms) {
    if (remaining_ms <= 0) {
        return 0;
    }
    if (remaining_ms > std::numeric_limits<int>::max()) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(remaining_ms);
}

}  // namespace

ToolGateway::ToolGateway(core::config::BridgeConfig config,
                         std::vector<registry::CommandSpec> catalog)
    : config_(std::move(config)), catalog_(std::move(catalog)) {}

const registry::CommandSpec* ToolGateway::find_spec(const std::string& name) const {
    for (const auto& spec : catalog_) {
        if (spec.name == name) {
            return &spec;
        }
    }
    return nullptr;
}

bool ToolGateway::connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return socket_.valid();
}

void ToolGateway::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    drop_connection(false);
}

core::errors::Result<json> ToolGateway::call(const std::string& name,
                                             const json& params) {
    // 1. Local checks, nothing is sent for a call the host would reject
    const registry::CommandSpec* spec = find_spec(name);
    if (spec == nullptr) {
        return BridgeError{ErrorKind::UnknownCommand, "Unknown command: " + name,
                           "unknown_command"};
    }
    auto normalized = registry::validate_params(*spec, params);
    if (core::errors::is_error(normalized)) {
        return core::errors::get_error(normalized);
    }

    protocol::CommandEnvelope command;
    command.name = name;
    command.params = std::move(core::errors::get_value(normalized));
    const std::string payload = protocol::encode_command(command) + "\n";

    // 2. One exchange at a time on the shared connection
    std::lock_guard<std::mutex> lock(mutex_);
    auto raw = exchange(payload);
    if (core::errors::is_error(raw)) {
        const auto& err = core::errors::get_error(raw);
        LOG_WARN("ToolGateway: " + name + " failed [" + err.code + "]: " + err.message);
        return err;
    }

    // 3. Map the envelope back onto a Result
    const auto& line = core::errors::get_value(raw);
    auto decoded = protocol::decode_response(line);
    if (core::errors::is_error(decoded)) {
        drop_connection(false);
        return core::errors::get_error(decoded);
    }
    auto& response = core::errors::get_value(decoded);
    if (!response.is_success()) {
        const auto& remote = response.error.value();
        LOG_DEBUG("ToolGateway: " + name + " returned " +
                  core::errors::to_string(remote.kind));
        return BridgeError{remote.kind, remote.message, "remote_error"};
    }
    return std::move(response.result);
}

void ToolGateway::drop_connection(const bool abortive) {
    if (abortive) {
        socket_.abort();
    } else {
        socket_.reset();
    }
    reader_.reset();
}

core::errors::Result<bool> ToolGateway::ensure_connected(const std::uint32_t timeout_ms) {
    if (socket_.valid()) {
        return true;
    }
    auto connecting = transport::connect_tcp(config_.host, config_.port, timeout_ms);
    if (core::errors::is_error(connecting)) {
        return core::errors::get_error(connecting);
    }
    socket_ = std::move(core::errors::get_value(connecting));
    reader_.emplace(config_.max_message_bytes);
    LOG_DEBUG("ToolGateway: connected to " + config_.host + ":" +
              std::to_string(config_.port));
    return true;
}

core::errors::Result<std::string> ToolGateway::exchange(const std::string& payload) {
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(config_.timeout_ms);

    // A kept connection the bridge has since closed (one request per
    // connection, restart) is replaced before anything is written to it.
    if (socket_.valid() && transport::peer_closed(socket_.fd())) {
        LOG_DEBUG("ToolGateway: kept connection was closed by the bridge, reconnecting");
        drop_connection(false);
    }

    // The close can also land between that check and the write. A reused
    // connection that fails before any response byte gets one more try on
    // a fresh one; a fresh connection is never retried.
    bool reused = socket_.valid();
    for (;;) {
        auto connected = ensure_connected(config_.timeout_ms);
        if (core::errors::is_error(connected)) {
            return core::errors::get_error(connected);
        }

        auto written = transport::write_all(socket_.fd(), payload);
        if (core::errors::is_error(written)) {
            drop_connection(false);
            if (reused) {
                LOG_DEBUG("ToolGateway: write on kept connection failed, retrying once");
                reused = false;
                continue;
            }
            return core::errors::get_error(written);
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                   deadline - std::chrono::steady_clock::now())
                                   .count();
        std::string line;
        const auto status = reader_->read_line(socket_.fd(), line, clamp_timeout(remaining));
        switch (status) {
            case transport::ReadStatus::Line:
                return line;
            case transport::ReadStatus::Timeout:
                // A late answer must not be read as the reply to the next
                // call. The reset also tells the bridge to drop the result.
                drop_connection(true);
                return BridgeError{ErrorKind::Timeout,
                                   "No response from host bridge within " +
                                       std::to_string(config_.timeout_ms) + " ms.",
                                   "response_timeout",
                                   "The host may be busy; the command can still run there."};
            case transport::ReadStatus::Overflow:
                drop_connection(true);
                return BridgeError{ErrorKind::Decode,
                                   "Response exceeds " +
                                       std::to_string(config_.max_message_bytes) + " bytes.",
                                   "response_too_large"};
            case transport::ReadStatus::Closed:
            case transport::ReadStatus::Error:
            default: {
                const bool nothing_read = reader_->buffered_bytes() == 0;
                drop_connection(false);
                if (reused && nothing_read) {
                    LOG_DEBUG("ToolGateway: kept connection closed before a response, retrying once");
                    reused = false;
                    continue;
                }
                return BridgeError{ErrorKind::Connectivity,
                                   "Connection to host bridge closed before a response arrived.",
                                   "connection_closed"};
            }
        }
    }
}

bool ToolGateway::is_server_available() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (socket_.valid() && !transport::peer_closed(socket_.fd())) {
        return true;
    }
    drop_connection(false);
    auto connected = ensure_connected(std::min<std::uint32_t>(config_.timeout_ms,
                                                              kAvailabilityTimeoutMs));
    if (core::errors::is_error(connected)) {
        LOG_WARN("ToolGateway: host bridge not available: " +
                 core::errors::get_error(connected).message);
        return false;
    }
    LOG_INFO("ToolGateway: host bridge available at " + config_.host + ":" +
             std::to_string(config_.port));
    return true;
}

core::errors::Result<json> ToolGateway::get_simple_info() {
    return call("get_simple_info");
}

core::errors::Result<json> ToolGateway::get_scene_info() {
    return call("get_scene_info");
}

core::errors::Result<json> ToolGateway::get_layers() {
    return call("get_layers");
}

core::errors::Result<json> ToolGateway::get_objects_with_metadata(
    const ObjectFilters& filters, const std::vector<std::string>& metadata_fields) {
    json params = json::object();
    json filter_object = json::object();
    if (filters.layer) {
        filter_object["layer"] = *filters.layer;
    }
    if (filters.name) {
        filter_object["name"] = *filters.name;
    }
    if (filters.short_id) {
        filter_object["short_id"] = *filters.short_id;
    }
    params["filters"] = std::move(filter_object);
    if (!metadata_fields.empty()) {
        params["metadata_fields"] = metadata_fields;
    }
    return call("get_objects_with_metadata", params);
}

core::errors::Result<json> ToolGateway::create_cube(const CubeRequest& request) {
    json params = {{"size", request.size},
                   {"location", json::array({request.x, request.y, request.z})}};
    if (request.name) {
        params["name"] = *request.name;
    }
    if (request.layer) {
        params["layer"] = *request.layer;
    }
    return call("create_cube", params);
}

core::errors::Result<json> ToolGateway::add_object_metadata(
    const std::string& object_id, const std::optional<std::string>& name,
    const std::optional<std::string>& description) {
    json params = {{"object_id", object_id}};
    if (name) {
        params["name"] = *name;
    }
    if (description) {
        params["description"] = *description;
    }
    return call("add_object_metadata", params);
}

core::errors::Result<json> ToolGateway::execute_code(
    const std::string& code, const std::optional<std::int64_t> timeout_ms) {
    json params = {{"code", code}};
    if (timeout_ms) {
        params["timeout_ms"] = *timeout_ms;
    }
    return call("execute_code", params);
}

core::errors::Result<json> ToolGateway::render_scene(const RenderRequest& request) {
    json params = {{"prompt", request.prompt},
                   {"width", request.width},
                   {"height", request.height}};
    if (request.seed) {
        params["seed"] = *request.seed;
    }
    return call("render_scene", params);
}

core::errors::Result<json> ToolGateway::capture_viewport(const ViewportRequest& request) {
    json params = {{"show_annotations", request.show_annotations},
                   {"max_size", request.max_size}};
    if (request.layer) {
        params["layer"] = *request.layer;
    }
    return call("capture_viewport", params);
}

core::errors::Result<json> ToolGateway::gh_get_context(
    const std::optional<std::string>& description) {
    json params = json::object();
    if (description) {
        params["description"] = *description;
    }
    return call("gh_get_context", params);
}

core::errors::Result<json> ToolGateway::gh_execute_code(const std::string& code,
                                                        const std::string& description) {
    return call("gh_execute_code", {{"code", code}, {"description", description}});
}

}  // namespace hostbridge::gateway
