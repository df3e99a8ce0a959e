#include "protocol/envelope_codec.hpp"

#include <utility>

namespace hostbridge::protocol {

using core::errors::BridgeError;
using core::errors::ErrorKind;
using nlohmann::json;

namespace {

std::string dump_line(const json& payload) {
    // replace: a handler may hand back bytes that are not valid UTF-8
    return payload.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string strip_line_ending(const std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        return line.substr(0, line.size() - 1);
    }
    return line;
}

BridgeError decode_error(const std::string& message) {
    return BridgeError{ErrorKind::Decode, message, "invalid_envelope"};
}

BridgeError response_error(const std::string& message) {
    return BridgeError{ErrorKind::Decode, message, "invalid_response"};
}

std::string redact_text(std::string text, const std::vector<std::string>& secrets) {
    for (const auto& secret : secrets) {
        if (secret.empty()) {
            continue;
        }
        std::string::size_type pos = 0;
        while ((pos = text.find(secret, pos)) != std::string::npos) {
            text.replace(pos, secret.size(), "[redacted]");
            pos += 10;
        }
    }
    return text;
}

json redact_value(const json& value, const std::vector<std::string>& secrets) {
    if (value.is_string()) {
        return redact_text(value.get<std::string>(), secrets);
    }
    if (value.is_array()) {
        json out = json::array();
        for (const auto& item : value) {
            out.push_back(redact_value(item, secrets));
        }
        return out;
    }
    if (value.is_object()) {
        json out = json::object();
        for (const auto& [key, item] : value.items()) {
            out[redact_text(key, secrets)] = redact_value(item, secrets);
        }
        return out;
    }
    return value;
}

}  // namespace

core::errors::Result<CommandEnvelope> decode_command(const std::string& line) {
    const std::string payload = strip_line_ending(line);
    if (payload.empty()) {
        return decode_error("Empty request payload.");
    }

    const json document = json::parse(payload, nullptr, false);
    if (document.is_discarded()) {
        return decode_error("Request payload is not valid JSON.");
    }
    if (!document.is_object()) {
        return decode_error("Request payload must be a JSON object.");
    }

    auto name_it = document.find("name");
    if (name_it == document.end()) {
        return decode_error("Request envelope is missing 'name'.");
    }
    if (!name_it->is_string() || name_it->get<std::string>().empty()) {
        return decode_error("Request 'name' must be a non-empty string.");
    }

    CommandEnvelope command;
    command.name = name_it->get<std::string>();

    auto params_it = document.find("params");
    if (params_it == document.end() || params_it->is_null()) {
        command.params = json::object();
    } else if (params_it->is_object()) {
        command.params = *params_it;
    } else {
        return decode_error("Request 'params' must be a JSON object.");
    }
    return command;
}

std::string encode_command(const CommandEnvelope& command) {
    json payload;
    payload["name"] = command.name;
    payload["params"] = command.params.is_null() ? json::object() : command.params;
    return dump_line(payload);
}

core::errors::Result<ResponseEnvelope> decode_response(const std::string& line) {
    const std::string payload = strip_line_ending(line);
    const json document = json::parse(payload, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return response_error("Response payload is not a JSON object.");
    }

    auto status_it = document.find("status");
    if (status_it == document.end() || !status_it->is_string()) {
        return response_error("Response envelope is missing 'status'.");
    }

    const std::string status = status_it->get<std::string>();
    const bool has_result = document.contains("result");
    const bool has_error = document.contains("error");

    if (status == "success") {
        if (!has_result || has_error) {
            return response_error(
                "Success response must carry 'result' and no 'error'.");
        }
        return ResponseEnvelope::success(document.at("result"));
    }

    if (status == "error") {
        if (!has_error || has_result) {
            return response_error(
                "Error response must carry 'error' and no 'result'.");
        }
        const json& error = document.at("error");
        if (!error.is_object() || !error.contains("kind") ||
            !error.at("kind").is_string() || !error.contains("message") ||
            !error.at("message").is_string()) {
            return response_error("Response 'error' must hold string 'kind' and 'message'.");
        }
        const auto kind = core::errors::kind_from_string(error.at("kind").get<std::string>());
        if (!kind.has_value()) {
            return response_error("Unknown error kind: " +
                                  error.at("kind").get<std::string>());
        }
        return ResponseEnvelope::failure(kind.value(),
                                         error.at("message").get<std::string>());
    }

    return response_error("Unknown response status: " + status);
}

std::string encode_response(const ResponseEnvelope& response) {
    json payload;
    payload["status"] = to_string(response.status);
    if (response.status == ResponseStatus::Success) {
        payload["result"] = response.result;
    } else {
        json error;
        error["kind"] = response.error.has_value()
                            ? core::errors::to_string(response.error->kind)
                            : core::errors::to_string(ErrorKind::Internal);
        error["message"] = response.error.has_value() ? response.error->message
                                                      : "Missing error detail.";
        payload["error"] = error;
    }
    return dump_line(payload);
}

void redact_response(ResponseEnvelope& response,
                     const std::vector<std::string>& secrets) {
    if (secrets.empty()) {
        return;
    }
    if (response.status == ResponseStatus::Success) {
        response.result = redact_value(response.result, secrets);
    } else if (response.error.has_value()) {
        response.error->message = redact_text(response.error->message, secrets);
    }
}

}  // namespace hostbridge::protocol
