#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/bridge_errors.hpp"

namespace {

using hostbridge::app::cli::GatewayAction;
using hostbridge::app::cli::GatewayOptions;
using hostbridge::app::cli::HostOptions;
using hostbridge::app::cli::parse_gateway_args;
using hostbridge::app::cli::parse_host_args;
using hostbridge::core::config::BridgeConfig;
using hostbridge::core::errors::ErrorKind;
using hostbridge::core::errors::Result;
using hostbridge::core::errors::get_error;
using hostbridge::core::errors::get_value;
using hostbridge::core::errors::is_error;

// Builds a mutable argv and hands it to `parse`.
template <typename Parse>
auto parse_tokens(const char* program, const std::vector<std::string>& tokens, Parse parse,
                  BridgeConfig base = {}) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back(program);
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse(static_cast<int>(argv.size()), argv.data(), std::move(base));
}

Result<HostOptions> parse_host(const std::vector<std::string>& tokens, BridgeConfig base = {}) {
    return parse_tokens("hostbridge_host", tokens, parse_host_args, std::move(base));
}

Result<GatewayOptions> parse_gateway(const std::vector<std::string>& tokens) {
    return parse_tokens("hostbridge_gateway", tokens, parse_gateway_args);
}

TEST(HostCliParserTest, NoFlagsKeepsBaseConfig) {
    BridgeConfig base;
    base.port = 7000;
    auto result = parse_host({}, base);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).config.port, 7000);
    EXPECT_TRUE(get_value(result).config.keep_alive);
    EXPECT_FALSE(get_value(result).verbose);
}

TEST(HostCliParserTest, AppliesEveryFlag) {
    auto result = parse_host({"--host", "0.0.0.0", "--port", "9000", "--max-batch", "4",
                              "--tick-ms", "25", "--secrets-file", "/tmp/s.json",
                              "--no-keep-alive", "--verbose"});
    ASSERT_FALSE(is_error(result));
    const auto& options = get_value(result);
    EXPECT_EQ(options.config.host, "0.0.0.0");
    EXPECT_EQ(options.config.port, 9000);
    EXPECT_EQ(options.config.max_batch, 4u);
    EXPECT_EQ(options.config.tick_interval_ms, 25u);
    EXPECT_EQ(options.config.secrets_file, std::filesystem::path("/tmp/s.json"));
    EXPECT_FALSE(options.config.keep_alive);
    EXPECT_TRUE(options.verbose);
}

TEST(HostCliParserTest, RejectsOutOfRangeValues) {
    auto port = parse_host({"--port", "70000"});
    ASSERT_TRUE(is_error(port));
    EXPECT_EQ(get_error(port).kind, ErrorKind::Configuration);

    auto batch = parse_host({"--max-batch", "0"});
    ASSERT_TRUE(is_error(batch));
    EXPECT_EQ(get_error(batch).code, "invalid_config");

    auto tick = parse_host({"--tick-ms", "fast"});
    ASSERT_TRUE(is_error(tick));
    EXPECT_EQ(get_error(tick).code, "invalid_config");
}

TEST(HostCliParserTest, RejectsUnknownAndIncompleteFlags) {
    auto unknown = parse_host({"--params", "{}"});
    ASSERT_TRUE(is_error(unknown));
    EXPECT_EQ(get_error(unknown).code, "unknown_argument");

    auto missing = parse_host({"--port"});
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "missing_value");

    auto empty_host = parse_host({"--host", ""});
    ASSERT_TRUE(is_error(empty_host));
    EXPECT_EQ(get_error(empty_host).code, "invalid_config");
}

TEST(HostCliParserTest, WorkdirMustExist) {
    auto missing = parse_host({"--workdir", "/nonexistent/hostbridge/workdir"});
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "invalid_path");

    const auto temp = std::filesystem::temp_directory_path();
    auto existing = parse_host({"--workdir", temp.string()});
    ASSERT_FALSE(is_error(existing));
    EXPECT_EQ(get_value(existing).working_directory, std::filesystem::canonical(temp));
}

TEST(HostCliParserTest, DefinitionMustBeAFile) {
    auto missing = parse_host({"--definition", "/nonexistent/hostbridge/graph.json"});
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "invalid_path");

    auto directory = parse_host({"--definition", std::filesystem::temp_directory_path().string()});
    ASSERT_TRUE(is_error(directory));
    EXPECT_EQ(get_error(directory).code, "invalid_path");

    const auto file = std::filesystem::temp_directory_path() / ".hostbridge_cli_definition.json";
    {
        std::ofstream out(file);
        out << R"({"components": []})";
    }
    auto existing = parse_host({"--definition", file.string()});
    std::error_code ec;
    std::filesystem::remove(file, ec);
    ASSERT_FALSE(is_error(existing));
    ASSERT_TRUE(get_value(existing).definition_file.has_value());
    EXPECT_EQ(get_value(existing).definition_file.value(), file);

    auto none = parse_host({});
    ASSERT_FALSE(is_error(none));
    EXPECT_FALSE(get_value(none).definition_file.has_value());
}

TEST(GatewayCliParserTest, FailsWhenCommandMissing) {
    auto result = parse_gateway({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::Configuration);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(GatewayCliParserTest, FailsWhenSubcommandUnknown) {
    auto result = parse_gateway({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_subcommand");
}

TEST(GatewayCliParserTest, CallNeedsCommandName) {
    auto bare = parse_gateway({"call"});
    ASSERT_TRUE(is_error(bare));
    EXPECT_EQ(get_error(bare).code, "missing_command_name");

    auto flag_first = parse_gateway({"call", "--params", "{}"});
    ASSERT_TRUE(is_error(flag_first));
    EXPECT_EQ(get_error(flag_first).code, "missing_command_name");
}

TEST(GatewayCliParserTest, ParsesListWithEndpoint) {
    auto result = parse_gateway({"list", "--host", "10.0.0.2", "--port", "9100"});
    ASSERT_FALSE(is_error(result));
    const auto& options = get_value(result);
    EXPECT_EQ(options.action, GatewayAction::List);
    EXPECT_EQ(options.config.host, "10.0.0.2");
    EXPECT_EQ(options.config.port, 9100);
}

TEST(GatewayCliParserTest, ListDoesNotTakeParams) {
    auto result = parse_gateway({"list", "--params", "{}"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(GatewayCliParserTest, ParsesPingWithTimeout) {
    auto result = parse_gateway({"ping", "--port", "9100", "--timeout-ms", "500"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).action, GatewayAction::Ping);
    EXPECT_EQ(get_value(result).config.port, 9100);
    EXPECT_EQ(get_value(result).config.timeout_ms, 500u);

    auto with_params = parse_gateway({"ping", "--params", "{}"});
    ASSERT_TRUE(is_error(with_params));
    EXPECT_EQ(get_error(with_params).code, "unknown_argument");
}

TEST(GatewayCliParserTest, ParsesCallWithParams) {
    auto result = parse_gateway({"call", "create_cube", "--params", R"({"size": 2.5})",
                                 "--timeout-ms", "5000", "--verbose"});
    ASSERT_FALSE(is_error(result));
    const auto& options = get_value(result);
    EXPECT_EQ(options.action, GatewayAction::Call);
    EXPECT_EQ(options.command_name, "create_cube");
    EXPECT_EQ(options.params.at("size"), 2.5);
    EXPECT_EQ(options.config.timeout_ms, 5000u);
    EXPECT_TRUE(options.verbose);
}

TEST(GatewayCliParserTest, CallWithoutParamsSendsEmptyObject) {
    auto result = parse_gateway({"call", "get_layers"});
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).params.is_object());
    EXPECT_TRUE(get_value(result).params.empty());
}

TEST(GatewayCliParserTest, RejectsParamsThatAreNotAnObject) {
    auto broken = parse_gateway({"call", "create_cube", "--params", "{size: 2"});
    ASSERT_TRUE(is_error(broken));
    EXPECT_EQ(get_error(broken).code, "invalid_params_json");

    auto array = parse_gateway({"call", "create_cube", "--params", "[1, 2]"});
    ASSERT_TRUE(is_error(array));
    EXPECT_EQ(get_error(array).code, "invalid_params_json");
}

TEST(GatewayCliParserTest, RejectsZeroTimeout) {
    auto result = parse_gateway({"list", "--timeout-ms", "0"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_config");
}

}  // namespace
