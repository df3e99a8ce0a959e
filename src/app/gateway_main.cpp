#include <iostream>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/config/bridge_config.hpp"
#include "core/config/ids.hpp"
#include "core/errors/bridge_errors.hpp"
#include "core/logging/logger.hpp"
#include "gateway/tool_gateway.hpp"
#include "registry/command_spec.hpp"

namespace {

// Distinct exit code per error kind, so scripts can branch without parsing stderr.
int exit_code_for(const hostbridge::core::errors::ErrorKind kind) {
    using hostbridge::core::errors::ErrorKind;
    switch (kind) {
        case ErrorKind::Configuration: return 2;
        case ErrorKind::Connectivity: return 10;
        case ErrorKind::Timeout: return 11;
        case ErrorKind::Decode: return 12;
        case ErrorKind::UnknownCommand: return 13;
        case ErrorKind::Handler: return 14;
        case ErrorKind::Shape: return 15;
        case ErrorKind::Internal:
        default: return 1;
    }
}

int report(const hostbridge::core::errors::BridgeError& err) {
    nlohmann::json out = {{"kind", hostbridge::core::errors::to_string(err.kind)},
                          {"message", err.message}};
    if (!err.hint.empty()) {
        out["hint"] = err.hint;
    }
    std::cerr << out.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    return exit_code_for(err.kind);
}

}  // namespace

int main(int argc, char* argv[]) {
    namespace errors = hostbridge::core::errors;
    auto& logger = hostbridge::core::logging::Logger::get();
    logger.set_tag(hostbridge::core::config::generate_session_id());
    logger.set_min_level(hostbridge::core::logging::LogLevel::WARN);

    // 1. Environment first, flags override it
    auto env_config = hostbridge::core::config::load_config_from_env();
    if (errors::is_error(env_config)) {
        return report(errors::get_error(env_config));
    }
    auto parsed =
        hostbridge::app::cli::parse_gateway_args(argc, argv, errors::get_value(env_config));
    if (errors::is_error(parsed)) {
        return report(errors::get_error(parsed));
    }
    const auto& options = errors::get_value(parsed);
    if (options.verbose) {
        logger.set_min_level(hostbridge::core::logging::LogLevel::DEBUG);
    }

    hostbridge::gateway::ToolGateway gateway(options.config);

    // 2. list: the catalog, no connection needed
    if (options.action == hostbridge::app::cli::GatewayAction::List) {
        nlohmann::json commands = nlohmann::json::array();
        for (const auto& spec : gateway.catalog()) {
            commands.push_back(hostbridge::registry::describe(spec));
        }
        std::cout << commands.dump(2) << std::endl;
        return 0;
    }

    // 3. ping: reachability only, never an error report
    if (options.action == hostbridge::app::cli::GatewayAction::Ping) {
        const bool available = gateway.is_server_available();
        std::cout << nlohmann::json{{"available", available}}.dump() << std::endl;
        return available ? 0 : exit_code_for(errors::ErrorKind::Connectivity);
    }

    // 4. call: result on stdout, error on stderr
    LOG_DEBUG("Calling " + options.command_name + " on " + options.config.host + ":" +
              std::to_string(options.config.port));
    auto result = gateway.call(options.command_name, options.params);
    if (errors::is_error(result)) {
        return report(errors::get_error(result));
    }
    std::cout << errors::get_value(result).dump(2, ' ', false,
                                                 nlohmann::json::error_handler_t::replace)
              << std::endl;
    return 0;
}
