#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "protocol/envelope_codec.hpp"

namespace {

using hostbridge::core::errors::ErrorKind;
using hostbridge::core::errors::get_error;
using hostbridge::core::errors::get_value;
using hostbridge::core::errors::is_error;
using hostbridge::protocol::CommandEnvelope;
using hostbridge::protocol::ResponseEnvelope;
using hostbridge::protocol::decode_command;
using hostbridge::protocol::decode_response;
using hostbridge::protocol::encode_command;
using hostbridge::protocol::encode_response;
using hostbridge::protocol::redact_response;
using nlohmann::json;

TEST(EnvelopeCodecTest, DecodesCommandWithParams) {
    auto decoded = decode_command(R"({"name":"create_cube","params":{"size":2}})");
    ASSERT_FALSE(is_error(decoded));
    EXPECT_EQ(get_value(decoded).name, "create_cube");
    EXPECT_EQ(get_value(decoded).params, json({{"size", 2}}));
}

TEST(EnvelopeCodecTest, MissingOrNullParamsBecomeEmptyObject) {
    auto missing = decode_command(R"({"name":"get_layers"})");
    ASSERT_FALSE(is_error(missing));
    EXPECT_TRUE(get_value(missing).params.is_object());
    EXPECT_TRUE(get_value(missing).params.empty());

    auto null_params = decode_command("{\"name\":\"get_layers\",\"params\":null}\r");
    ASSERT_FALSE(is_error(null_params));
    EXPECT_TRUE(get_value(null_params).params.is_object());
}

TEST(EnvelopeCodecTest, RejectsMalformedCommands) {
    const std::vector<std::string> bad = {
        "",
        "not json",
        "[1,2,3]",
        R"({"params":{}})",
        R"({"name":""})",
        R"({"name":42})",
        R"({"name":"x","params":[1]})",
        R"({"name":"x","params":"size=1"})",
        "{\"name\":\"\xff\xfe\"}",
    };
    for (const auto& line : bad) {
        auto decoded = decode_command(line);
        ASSERT_TRUE(is_error(decoded)) << line;
        EXPECT_EQ(get_error(decoded).kind, ErrorKind::Decode) << line;
        EXPECT_EQ(get_error(decoded).code, "invalid_envelope");
    }
}

TEST(EnvelopeCodecTest, EncodedEnvelopeIsOneLine) {
    CommandEnvelope command;
    command.name = "execute_code";
    command.params = {{"code", "echo a\necho b"}};
    const std::string line = encode_command(command);
    EXPECT_EQ(line.find('\n'), std::string::npos);

    auto decoded = decode_command(line);
    ASSERT_FALSE(is_error(decoded));
    EXPECT_EQ(get_value(decoded).params.at("code"), "echo a\necho b");
}

TEST(EnvelopeCodecTest, SuccessCarriesResultOnly) {
    const json payload =
        json::parse(encode_response(ResponseEnvelope::success(json::array({"Default", "Layer01"}))));
    EXPECT_EQ(payload.at("status"), "success");
    EXPECT_EQ(payload.at("result"), json::array({"Default", "Layer01"}));
    EXPECT_FALSE(payload.contains("error"));
}

TEST(EnvelopeCodecTest, NullResultIsStillWritten) {
    const json payload = json::parse(encode_response(ResponseEnvelope::success(nullptr)));
    ASSERT_TRUE(payload.contains("result"));
    EXPECT_TRUE(payload.at("result").is_null());
}

TEST(EnvelopeCodecTest, ErrorCarriesKindAndMessageOnly) {
    const json payload = json::parse(encode_response(
        ResponseEnvelope::failure(ErrorKind::Handler, "size must be positive")));
    EXPECT_EQ(payload.at("status"), "error");
    EXPECT_EQ(payload.at("error").at("kind"), "HandlerError");
    EXPECT_EQ(payload.at("error").at("message"), "size must be positive");
    EXPECT_FALSE(payload.contains("result"));
}

TEST(EnvelopeCodecTest, DecodesResponses) {
    auto ok = decode_response(R"({"status":"success","result":{"count":2}})");
    ASSERT_FALSE(is_error(ok));
    EXPECT_TRUE(get_value(ok).is_success());
    EXPECT_EQ(get_value(ok).result.at("count"), 2);

    auto failed =
        decode_response(R"({"status":"error","error":{"kind":"ShapeError","message":"bad"}})");
    ASSERT_FALSE(is_error(failed));
    ASSERT_TRUE(get_value(failed).error.has_value());
    EXPECT_EQ(get_value(failed).error->kind, ErrorKind::Shape);
    EXPECT_EQ(get_value(failed).error->message, "bad");
}

TEST(EnvelopeCodecTest, RejectsInconsistentResponses) {
    const std::vector<std::string> bad = {
        "garbage",
        R"({"result":1})",
        R"({"status":"success"})",
        R"({"status":"success","result":1,"error":{"kind":"HandlerError","message":"x"}})",
        R"({"status":"error","error":{"kind":"Nope","message":"x"}})",
        R"({"status":"error","error":"x"})",
        R"({"status":"pending","result":1})",
    };
    for (const auto& line : bad) {
        auto decoded = decode_response(line);
        ASSERT_TRUE(is_error(decoded)) << line;
        EXPECT_EQ(get_error(decoded).code, "invalid_response") << line;
    }
}

TEST(EnvelopeCodecTest, InvalidUtf8InResultIsReplaced) {
    const std::string line =
        encode_response(ResponseEnvelope::success(std::string("ok \xff bytes")));
    auto decoded = decode_response(line);
    ASSERT_FALSE(is_error(decoded));
    EXPECT_TRUE(get_value(decoded).result.is_string());
}

TEST(EnvelopeCodecTest, RedactsSecretsInResultAndError) {
    auto success = ResponseEnvelope::success(
        {{"token", "r8_secret"}, {"nested", {"prefix r8_secret suffix"}}, {"r8_secret", 1}});
    redact_response(success, {"r8_secret"});
    const std::string line = encode_response(success);
    EXPECT_EQ(line.find("r8_secret"), std::string::npos);
    EXPECT_NE(line.find("[redacted]"), std::string::npos);

    auto failure = ResponseEnvelope::failure(ErrorKind::Handler, "bad token r8_secret");
    redact_response(failure, {"r8_secret"});
    EXPECT_EQ(failure.error->message, "bad token [redacted]");
}

}  // namespace
