#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/secret_store.hpp"
#include "core/errors/bridge_errors.hpp"
#include "host/node_graph.hpp"
#include "host/scene_document.hpp"
#include "registry/command_registry.hpp"

namespace hostbridge::host {

// Secret key the render handler needs. REPLICATE_TOKEN is accepted as a
// fallback name.
inline constexpr const char* kRenderTokenKey = "REPLICATE_API_TOKEN";
inline constexpr const char* kRenderEndpoint = "https://api.replicate.com/v1/predictions";
inline constexpr const char* kRenderModel = "black-forest-labs/flux-depth-dev";

nlohmann::json describe_object(const SceneObject& object);

// Binds every catalog command to a handler working on `document` and
// `graph`, which must outlive the registry along with `secrets`. Scripts run
// in `script_directory` and are killed once `cancel_token` is set.
core::errors::Result<registry::CommandRegistry> build_scene_registry(
    SceneDocument& document, NodeGraph& graph, const core::config::SecretStore& secrets,
    std::filesystem::path script_directory = ".",
    std::shared_ptr<std::atomic_bool> cancel_token = nullptr);

}  // namespace hostbridge::host
