#include "cli_parser.hpp"
#include <limits>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

namespace hostbridge::app::cli {

    using namespace hostbridge::core::errors;
    using hostbridge::core::config::BridgeConfig;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> host;
        std::optional<std::string> port;
        std::optional<std::string> timeout_ms;
        std::optional<std::string> max_batch;
        std::optional<std::string> tick_ms;
        std::optional<std::string> secrets_file;
        std::optional<std::string> workdir;
        std::optional<std::string> definition;
        std::optional<std::string> params;
        bool no_keep_alive = false;
        bool verbose = false;
    };

    namespace {

        BridgeError usage_error(std::string message, std::string code, std::string hint = "") {
            return BridgeError{ErrorKind::Configuration, std::move(message), std::move(code),
                               std::move(hint)};
        }

        // Reads "--flag value" pairs and switches. `allowed` lists the value flags the
        // executable accepts; anything else is an unknown argument.
        std::optional<BridgeError> read_flags(const std::vector<std::string>& args,
                                              const std::vector<std::string>& allowed,
                                              RawCliOptions& raw) {
            auto is_allowed = [&allowed](const std::string& flag) {
                for (const auto& candidate : allowed) {
                    if (candidate == flag) return true;
                }
                return false;
            };

            for (size_t i = 0; i < args.size(); ++i) {
                const std::string& arg = args[i];
                if (arg == "--verbose") {
                    raw.verbose = true;
                    continue;
                }
                if (arg == "--no-keep-alive" && is_allowed(arg)) {
                    raw.no_keep_alive = true;
                    continue;
                }
                if (!is_allowed(arg) || arg == "--no-keep-alive") {
                    return usage_error("Unknown argument: " + arg, "unknown_argument");
                }
                if (i + 1 >= args.size()) {
                    return usage_error("Missing value for " + arg, "missing_value");
                }
                const std::string& value = args[++i];
                if (arg == "--host") raw.host = value;
                else if (arg == "--port") raw.port = value;
                else if (arg == "--timeout-ms") raw.timeout_ms = value;
                else if (arg == "--max-batch") raw.max_batch = value;
                else if (arg == "--tick-ms") raw.tick_ms = value;
                else if (arg == "--secrets-file") raw.secrets_file = value;
                else if (arg == "--workdir") raw.workdir = value;
                else if (arg == "--definition") raw.definition = value;
                else if (arg == "--params") raw.params = value;
            }
            return std::nullopt;
        }

        // Applies the endpoint flags both executables share.
        std::optional<BridgeError> apply_common(const RawCliOptions& raw, BridgeConfig& config) {
            if (raw.host) {
                if (raw.host->empty()) {
                    return usage_error("--host cannot be empty", "invalid_config");
                }
                config.host = raw.host.value();
            }
            if (raw.port) {
                auto port = core::config::parse_port(raw.port.value(), "--port");
                if (is_error(port)) return get_error(port);
                config.port = get_value(port);
            }
            if (raw.timeout_ms) {
                auto timeout = core::config::parse_unsigned(raw.timeout_ms.value(), "--timeout-ms", 1,
                                                            24u * 60u * 60u * 1000u);
                if (is_error(timeout)) return get_error(timeout);
                config.timeout_ms = static_cast<uint32_t>(get_value(timeout));
            }
            return std::nullopt;
        }

    } // namespace

    Result<HostOptions> parse_host_args(int argc, char* argv[], BridgeConfig base) {
        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) { // Start at 1 to skip program name
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        const std::vector<std::string> allowed = {"--host", "--port", "--max-batch", "--tick-ms",
                                                  "--secrets-file", "--workdir", "--definition",
                                                  "--no-keep-alive"};
        if (auto err = read_flags(args, allowed, raw)) {
            return err.value();
        }

        // 3. Validator Phase: Enforce logic and bounds
        HostOptions options;
        options.config = std::move(base);
        options.verbose = raw.verbose;
        if (auto err = apply_common(raw, options.config)) {
            return err.value();
        }

        if (raw.max_batch) {
            auto batch = core::config::parse_unsigned(raw.max_batch.value(), "--max-batch", 1, 1024);
            if (is_error(batch)) return get_error(batch);
            options.config.max_batch = static_cast<size_t>(get_value(batch));
        }
        if (raw.tick_ms) {
            auto tick = core::config::parse_unsigned(raw.tick_ms.value(), "--tick-ms", 1, 10000);
            if (is_error(tick)) return get_error(tick);
            options.config.tick_interval_ms = static_cast<uint32_t>(get_value(tick));
        }
        if (raw.secrets_file) {
            options.config.secrets_file = std::filesystem::path(raw.secrets_file.value());
        }
        if (raw.no_keep_alive) {
            options.config.keep_alive = false;
        }

        // Path validation
        if (raw.workdir) {
            std::filesystem::path p(raw.workdir.value());
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return usage_error("Working directory does not exist or is not a directory", "invalid_path");
            }

            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return usage_error("Failed to canonicalize working directory", "invalid_path");
            }
            options.working_directory = std::move(canonical_path);
        }
        if (raw.definition) {
            std::filesystem::path p(raw.definition.value());
            std::error_code path_ec;
            if (!std::filesystem::is_regular_file(p, path_ec) || path_ec) {
                return usage_error("Definition file does not exist: " + p.string(), "invalid_path");
            }
            options.definition_file = std::move(p);
        }

        return options;
    }

    Result<GatewayOptions> parse_gateway_args(int argc, char* argv[], BridgeConfig base) {
        if (argc < 2) {
            return usage_error("No command provided.", "missing_command",
                               "Usage: hostbridge_gateway list | ping | call <name> [--params JSON]");
        }

        GatewayOptions options;
        options.config = std::move(base);

        const std::string command = argv[1];
        int first_flag = 2;
        if (command == "list") {
            options.action = GatewayAction::List;
        } else if (command == "ping") {
            options.action = GatewayAction::Ping;
        } else if (command == "call") {
            if (argc < 3 || std::string(argv[2]).rfind("--", 0) == 0) {
                return usage_error("Missing command name for call.", "missing_command_name",
                                   "Usage: hostbridge_gateway call <name> [--params JSON]");
            }
            options.action = GatewayAction::Call;
            options.command_name = argv[2];
            first_flag = 3;
        } else {
            return usage_error("Unknown subcommand: " + command, "unknown_subcommand",
                               "Use 'list', 'ping' or 'call'.");
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = first_flag; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        std::vector<std::string> allowed = {"--host", "--port", "--timeout-ms"};
        if (options.action == GatewayAction::Call) {
            allowed.push_back("--params");
        }
        if (auto err = read_flags(args, allowed, raw)) {
            return err.value();
        }

        options.verbose = raw.verbose;
        if (auto err = apply_common(raw, options.config)) {
            return err.value();
        }

        // Params arrive as one JSON object literal
        if (raw.params) {
            auto parsed = nlohmann::json::parse(raw.params.value(), nullptr, false);
            if (parsed.is_discarded() || !parsed.is_object()) {
                return usage_error("--params must be a JSON object", "invalid_params_json",
                                   "Example: --params '{\"size\": 2}'");
            }
            options.params = std::move(parsed);
        }

        return options;
    }

} // namespace hostbridge::app::cli
