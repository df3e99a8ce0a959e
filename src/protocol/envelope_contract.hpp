#pragma once
#include <optional>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"

namespace hostbridge::protocol {

    // What the gateway sends: a command name plus a flat map of named values
    struct CommandEnvelope {
        std::string name;
        nlohmann::json params = nlohmann::json::object();
    };

    enum class ResponseStatus {
        Success,
        Error
    };

    struct ResponseError {
        core::errors::ErrorKind kind;
        std::string message;
    };

    // What the bridge sends back. Build it through success()/failure() so
    // exactly one of result/error is populated.
    struct ResponseEnvelope {
        ResponseStatus status = ResponseStatus::Success;
        nlohmann::json result;                // meaningful iff Success
        std::optional<ResponseError> error;   // present iff Error

        static ResponseEnvelope success(nlohmann::json value) {
            ResponseEnvelope response;
            response.status = ResponseStatus::Success;
            response.result = std::move(value);
            return response;
        }

        static ResponseEnvelope failure(core::errors::ErrorKind kind,
                                        std::string message) {
            ResponseEnvelope response;
            response.status = ResponseStatus::Error;
            response.error = ResponseError{kind, std::move(message)};
            return response;
        }

        static ResponseEnvelope failure(const core::errors::BridgeError& error) {
            return failure(error.kind, error.message);
        }

        bool is_success() const { return status == ResponseStatus::Success; }
    };

    inline std::string to_string(const ResponseStatus status) {
        switch (status) {
            case ResponseStatus::Success:
                return "success";
            case ResponseStatus::Error:
                return "error";
            default:
                return "unknown";
        }
    }

} // namespace hostbridge::protocol
