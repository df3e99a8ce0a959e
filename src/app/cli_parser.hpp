#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/bridge_config.hpp"
#include "core/errors/bridge_errors.hpp"

namespace hostbridge::app::cli {

    // hostbridge_host [--host H] [--port P] [--max-batch N] [--tick-ms N]
    //                 [--secrets-file F] [--workdir D] [--definition F]
    //                 [--no-keep-alive] [--verbose]
    struct HostOptions {
        core::config::BridgeConfig config;
        std::filesystem::path working_directory = ".";
        std::optional<std::filesystem::path> definition_file;
        bool verbose = false;
    };

    enum class GatewayAction {
        List,
        Call,
        Ping
    };

    // hostbridge_gateway list
    // hostbridge_gateway ping
    // hostbridge_gateway call <name> [--params JSON]
    // both accept [--host H] [--port P] [--timeout-ms N] [--verbose]
    struct GatewayOptions {
        GatewayAction action = GatewayAction::List;
        std::string command_name;
        nlohmann::json params = nlohmann::json::object();
        core::config::BridgeConfig config;
        bool verbose = false;
    };

    // Flags override `base`, which normally comes from the environment.
    core::errors::Result<HostOptions> parse_host_args(int argc, char* argv[],
                                                      core::config::BridgeConfig base = {});
    core::errors::Result<GatewayOptions> parse_gateway_args(int argc, char* argv[],
                                                            core::config::BridgeConfig base = {});

} // namespace hostbridge::app::cli
