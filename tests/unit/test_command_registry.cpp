#include <string>
#include <unordered_map>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "registry/command_catalog.hpp"
#include "registry/command_registry.hpp"
#include "registry/command_spec.hpp"

namespace {

using hostbridge::core::errors::ErrorKind;
using hostbridge::core::errors::Result;
using hostbridge::core::errors::get_error;
using hostbridge::core::errors::get_value;
using hostbridge::core::errors::is_error;
using hostbridge::registry::CommandEntry;
using hostbridge::registry::CommandHandler;
using hostbridge::registry::CommandRegistry;
using hostbridge::registry::CommandSpec;
using hostbridge::registry::ParamType;
using hostbridge::registry::bind_handlers;
using hostbridge::registry::host_command_specs;
using hostbridge::registry::validate_params;
using nlohmann::json;

CommandHandler echo_handler() {
    return [](const json& params) -> Result<json> { return params; };
}

CommandSpec cube_spec() {
    return {"create_cube",
            "test cube",
            {{"size", ParamType::Number, false, 1.0, ""},
             {"name", ParamType::String, false, json(), ""},
             {"count", ParamType::Integer, false, json(), ""},
             {"code", ParamType::String, true, json(), ""}}};
}

TEST(CommandRegistryTest, BuildsAndFindsExactNames) {
    auto built = CommandRegistry::build({{{"get_layers", "", {}}, echo_handler()},
                                         {{"create_cube", "", {}}, echo_handler()}});
    ASSERT_FALSE(is_error(built));
    const auto& registry = get_value(built);
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_TRUE(registry.contains("get_layers"));
    EXPECT_FALSE(registry.contains("Get_Layers"));
    EXPECT_FALSE(registry.contains("get_layers "));
    EXPECT_EQ(registry.find("missing"), nullptr);
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"get_layers", "create_cube"}));
}

TEST(CommandRegistryTest, RejectsDuplicateNames) {
    auto built = CommandRegistry::build(
        {{{"get_layers", "", {}}, echo_handler()}, {{"get_layers", "", {}}, echo_handler()}});
    ASSERT_TRUE(is_error(built));
    EXPECT_EQ(get_error(built).kind, ErrorKind::Internal);
    EXPECT_EQ(get_error(built).code, "invalid_registry");
}

TEST(CommandRegistryTest, RejectsEmptyNameAndMissingHandler) {
    EXPECT_TRUE(is_error(CommandRegistry::build({{{"", "", {}}, echo_handler()}})));
    EXPECT_TRUE(is_error(CommandRegistry::build({{{"get_layers", "", {}}, CommandHandler()}})));
}

TEST(CommandRegistryTest, BindHandlersRequiresOneHandlerPerSpec) {
    const std::vector<CommandSpec> specs = {{"a", "", {}}, {"b", "", {}}};

    std::unordered_map<std::string, CommandHandler> missing = {{"a", echo_handler()}};
    auto unbound = bind_handlers(specs, missing);
    ASSERT_TRUE(is_error(unbound));
    EXPECT_NE(get_error(unbound).message.find("b"), std::string::npos);

    std::unordered_map<std::string, CommandHandler> extra = {
        {"a", echo_handler()}, {"b", echo_handler()}, {"c", echo_handler()}};
    auto orphan = bind_handlers(specs, extra);
    ASSERT_TRUE(is_error(orphan));
    EXPECT_NE(get_error(orphan).message.find("c"), std::string::npos);

    std::unordered_map<std::string, CommandHandler> exact = {{"a", echo_handler()},
                                                             {"b", echo_handler()}};
    auto bound = bind_handlers(specs, exact);
    ASSERT_FALSE(is_error(bound));
    EXPECT_EQ(get_value(bound).size(), 2u);
}

TEST(CommandRegistryTest, CatalogNamesAreUnique) {
    const auto specs = host_command_specs();
    EXPECT_EQ(specs.size(), 11u);
    std::vector<CommandEntry> entries;
    for (const auto& spec : specs) {
        entries.push_back({spec, echo_handler()});
    }
    EXPECT_FALSE(is_error(CommandRegistry::build(entries)));
}

TEST(ValidateParamsTest, FillsDefaultsAndDropsNullOptionals) {
    auto normalized = validate_params(cube_spec(), {{"code", "x"}, {"name", nullptr}});
    ASSERT_FALSE(is_error(normalized));
    const json& params = get_value(normalized);
    EXPECT_EQ(params.at("size"), 1.0);
    EXPECT_EQ(params.at("code"), "x");
    EXPECT_FALSE(params.contains("name"));
    EXPECT_FALSE(params.contains("count"));
}

TEST(ValidateParamsTest, RejectsUnknownKey) {
    auto normalized = validate_params(cube_spec(), {{"code", "x"}, {"colour", "red"}});
    ASSERT_TRUE(is_error(normalized));
    EXPECT_EQ(get_error(normalized).kind, ErrorKind::Shape);
    EXPECT_EQ(get_error(normalized).code, "unexpected_param");
    EXPECT_EQ(get_error(normalized).message.rfind("create_cube: ", 0), 0u);
}

TEST(ValidateParamsTest, RejectsMissingOrNullRequired) {
    auto missing = validate_params(cube_spec(), json::object());
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "missing_param");

    auto null_value = validate_params(cube_spec(), {{"code", nullptr}});
    ASSERT_TRUE(is_error(null_value));
    EXPECT_EQ(get_error(null_value).code, "missing_param");
}

TEST(ValidateParamsTest, ChecksTypes) {
    auto text_size = validate_params(cube_spec(), {{"code", "x"}, {"size", "big"}});
    ASSERT_TRUE(is_error(text_size));
    EXPECT_EQ(get_error(text_size).code, "param_type_mismatch");

    auto float_count = validate_params(cube_spec(), {{"code", "x"}, {"count", 1.5}});
    ASSERT_TRUE(is_error(float_count));

    auto int_size = validate_params(cube_spec(), {{"code", "x"}, {"size", 3}});
    ASSERT_FALSE(is_error(int_size));
    EXPECT_EQ(get_value(int_size).at("size"), 3);
}

TEST(ValidateParamsTest, RejectsNonObjectParams) {
    auto normalized = validate_params(cube_spec(), json::array({1}));
    ASSERT_TRUE(is_error(normalized));
    EXPECT_EQ(get_error(normalized).code, "params_not_object");
}

TEST(ValidateParamsTest, DescribeListsParams) {
    const json described = hostbridge::registry::describe(cube_spec());
    EXPECT_EQ(described.at("name"), "create_cube");
    ASSERT_EQ(described.at("params").size(), 4u);
    EXPECT_EQ(described.at("params")[0].at("type"), "number");
    EXPECT_EQ(described.at("params")[0].at("default"), 1.0);
    EXPECT_EQ(described.at("params")[3].at("required"), true);
}

}  // namespace
