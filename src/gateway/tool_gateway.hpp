#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/bridge_config.hpp"
#include "core/errors/bridge_errors.hpp"
#include "registry/command_catalog.hpp"
#include "registry/command_spec.hpp"
#include "transport/socket.hpp"

namespace hostbridge::gateway {

struct ObjectFilters {
    std::optional<std::string> layer;
    std::optional<std::string> name;
    std::optional<std::string> short_id;
};

struct CubeRequest {
    double size = 1.0;
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
    std::optional<std::string> name;
    std::optional<std::string> layer;
};

struct RenderRequest {
    std::string prompt;
    std::int64_t width = 1024;
    std::int64_t height = 1024;
    std::optional<std::int64_t> seed;
};

struct ViewportRequest {
    std::optional<std::string> layer;
    bool show_annotations = true;
    std::int64_t max_size = 800;
};

// The out-of-host end of the bridge: one typed method per host command plus
// a generic call(). Keeps one connection open between calls and reconnects
// after any transport failure or timeout.
class ToolGateway {
public:
    explicit ToolGateway(core::config::BridgeConfig config,
                         std::vector<registry::CommandSpec> catalog =
                             registry::host_command_specs());

    ToolGateway(const ToolGateway&) = delete;
    ToolGateway& operator=(const ToolGateway&) = delete;

    // Checks the call against the catalog, sends it, and waits at most
    // timeout_ms for the correlated response. A remote error comes back
    // with its kind and message unchanged.
    core::errors::Result<nlohmann::json> call(const std::string& name,
                                              const nlohmann::json& params =
                                                  nlohmann::json::object());

    core::errors::Result<nlohmann::json> get_simple_info();
    core::errors::Result<nlohmann::json> get_scene_info();
    core::errors::Result<nlohmann::json> get_layers();
    core::errors::Result<nlohmann::json> get_objects_with_metadata(
        const ObjectFilters& filters = {},
        const std::vector<std::string>& metadata_fields = {});
    core::errors::Result<nlohmann::json> create_cube(const CubeRequest& request = {});
    core::errors::Result<nlohmann::json> add_object_metadata(
        const std::string& object_id, const std::optional<std::string>& name = std::nullopt,
        const std::optional<std::string>& description = std::nullopt);
    core::errors::Result<nlohmann::json> execute_code(
        const std::string& code, std::optional<std::int64_t> timeout_ms = std::nullopt);
    core::errors::Result<nlohmann::json> render_scene(const RenderRequest& request);
    core::errors::Result<nlohmann::json> capture_viewport(const ViewportRequest& request = {});
    core::errors::Result<nlohmann::json> gh_get_context(
        const std::optional<std::string>& description = std::nullopt);
    core::errors::Result<nlohmann::json> gh_execute_code(const std::string& code,
                                                         const std::string& description);

    // Reuses a live connection or opens one within a short bound. Never
    // fails; an unreachable bridge is simply reported as unavailable.
    bool is_server_available();

    bool connected() const;
    void disconnect();

    const std::vector<registry::CommandSpec>& catalog() const { return catalog_; }
    const core::config::BridgeConfig& config() const { return config_; }

private:
    const registry::CommandSpec* find_spec(const std::string& name) const;
    core::errors::Result<std::string> exchange(const std::string& payload);
    core::errors::Result<bool> ensure_connected(std::uint32_t timeout_ms);
    void drop_connection(bool abortive);

    static constexpr std::uint32_t kAvailabilityTimeoutMs = 2000;

    core::config::BridgeConfig config_;
    std::vector<registry::CommandSpec> catalog_;

    mutable std::mutex mutex_;
    transport::SocketHandle socket_;
    std::optional<transport::LineReader> reader_;
};

}  // namespace hostbridge::gateway
