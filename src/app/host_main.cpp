#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "bridge/host_bridge.hpp"
#include "core/config/bridge_config.hpp"
#include "core/config/secret_store.hpp"
#include "core/errors/bridge_errors.hpp"
#include "core/logging/logger.hpp"
#include "host/node_graph.hpp"
#include "host/scene_commands.hpp"
#include "host/scene_document.hpp"
#include "runtime/execution_scheduler.hpp"
#include "runtime/idle_loop.hpp"

namespace {

std::shared_ptr<std::atomic_bool> g_stop_token = std::make_shared<std::atomic_bool>(false);

extern "C" void handle_stop_signal(int) {
    g_stop_token->store(true);
}

hostbridge::core::errors::Result<bool> load_definition_file(const std::filesystem::path& path,
                                                            hostbridge::host::NodeGraph& graph) {
    using hostbridge::core::errors::BridgeError;
    using hostbridge::core::errors::ErrorKind;

    std::ifstream in(path);
    if (!in) {
        return BridgeError{ErrorKind::Configuration, "Cannot read definition file " + path.string(),
                           "definition_unreadable"};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    const auto definition = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (definition.is_discarded()) {
        return BridgeError{ErrorKind::Configuration, "Definition file is not valid JSON",
                           "invalid_definition"};
    }
    auto loaded = graph.load_definition(definition);
    if (hostbridge::core::errors::is_error(loaded)) {
        const auto& err = hostbridge::core::errors::get_error(loaded);
        return BridgeError{ErrorKind::Configuration, err.message, err.code};
    }
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    namespace errors = hostbridge::core::errors;
    auto& logger = hostbridge::core::logging::Logger::get();
    logger.set_tag("host");

    // 1. Environment first, flags override it
    auto env_config = hostbridge::core::config::load_config_from_env();
    if (errors::is_error(env_config)) {
        const auto& err = errors::get_error(env_config);
        LOG_ERROR("Configuration error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }

    auto parsed = hostbridge::app::cli::parse_host_args(argc, argv, errors::get_value(env_config));
    if (errors::is_error(parsed)) {
        const auto& err = errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& options = errors::get_value(parsed);
    const auto& config = options.config;
    if (options.verbose) {
        logger.set_min_level(hostbridge::core::logging::LogLevel::DEBUG);
    }

    // 2. Secrets are masked in logs before anything else is logged
    auto loaded = hostbridge::core::config::SecretStore::load(config.secrets_file);
    if (errors::is_error(loaded)) {
        const auto& err = errors::get_error(loaded);
        LOG_ERROR("Secrets error [" + err.code + "]: " + err.message);
        return 2;
    }
    const auto& secrets = errors::get_value(loaded);
    for (const auto& value : secrets.values()) {
        logger.add_redaction(value);
    }
    LOG_INFO("Loaded " + std::to_string(secrets.size()) + " secrets from " +
             config.secrets_file.string());

    // 3. Document, graph, registry and scheduler live on this thread
    hostbridge::host::SceneDocument document;
    hostbridge::host::NodeGraph graph;
    if (options.definition_file) {
        auto loaded_graph = load_definition_file(options.definition_file.value(), graph);
        if (errors::is_error(loaded_graph)) {
            const auto& err = errors::get_error(loaded_graph);
            LOG_ERROR("Definition error [" + err.code + "]: " + err.message);
            return 2;
        }
        LOG_INFO("Loaded node graph with " + std::to_string(graph.component_count()) +
                 " components from " + options.definition_file->string());
    }
    // Scripts still running at shutdown are killed through the stop token.
    auto built = hostbridge::host::build_scene_registry(document, graph, secrets,
                                                        options.working_directory, g_stop_token);
    if (errors::is_error(built)) {
        const auto& err = errors::get_error(built);
        LOG_ERROR("Registry error [" + err.code + "]: " + err.message);
        return 3;
    }
    const auto& registry = errors::get_value(built);

    hostbridge::runtime::ExecutionScheduler scheduler(config.max_batch);
    scheduler.bind_to_current_thread();

    // 4. Listener threads feed the scheduler
    hostbridge::bridge::HostBridge bridge(config, registry, scheduler, secrets.values());
    auto started = bridge.start();
    if (errors::is_error(started)) {
        const auto& err = errors::get_error(started);
        LOG_ERROR("Failed to start bridge [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 4;
    }
    logger.set_tag(bridge.session_id());
    LOG_INFO("Serving " + std::to_string(registry.size()) + " commands on port " +
             std::to_string(errors::get_value(started)));

    // 5. The host loop drains the scheduler once per idle turn
    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);

    hostbridge::runtime::IdleLoop loop(std::chrono::milliseconds(config.tick_interval_ms));
    loop.add_idle_handler("bridge-scheduler", [&scheduler]() {
        static_cast<void>(scheduler.tick());
    });
    loop.run(g_stop_token);

    // 6. Shutdown: no new calls, queued ones are dropped
    bridge.stop();
    const auto dropped = scheduler.discard_pending();
    LOG_INFO("Executed " + std::to_string(scheduler.executed_total()) + " calls, discarded " +
             std::to_string(scheduler.discarded_total()) + " (" + std::to_string(dropped) +
             " still queued at shutdown)");

    return 0;
}
