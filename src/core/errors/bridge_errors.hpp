#pragma once
#include <optional>
#include <string>
#include <variant>

namespace hostbridge::core::errors {

    // 1. Typed error kinds. The first six travel on the wire inside
    // error response envelopes; the last two stay local to a process.
    enum class ErrorKind {
        Connectivity,    // Gateway cannot reach or keep the transport
        Timeout,         // No response within the gateway's bound
        Decode,          // Malformed request envelope
        UnknownCommand,  // Name not in the command registry
        Handler,         // Registered handler failed while running
        Shape,           // Params do not match the command's declared shape
        Configuration,   // Bad env var, CLI flag or secrets file
        Internal         // Socket setup, thread plumbing, logic bugs
    };

    // The standardized error payload
    struct BridgeError {
        ErrorKind kind;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // 2. Propagation strategy: a Result holds either a value of type T or a
    // BridgeError.
    template <typename T>
    using Result = std::variant<T, BridgeError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<BridgeError>(result);
    }

    template <typename T>
    const BridgeError& get_error(const Result<T>& result) {
        return std::get<BridgeError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    // 3. Wire names used in the "kind" field of error envelopes.
    inline std::string to_string(const ErrorKind kind) {
        switch (kind) {
            case ErrorKind::Connectivity:   return "ConnectivityError";
            case ErrorKind::Timeout:        return "TimeoutError";
            case ErrorKind::Decode:         return "DecodeError";
            case ErrorKind::UnknownCommand: return "UnknownCommand";
            case ErrorKind::Handler:        return "HandlerError";
            case ErrorKind::Shape:          return "ShapeError";
            case ErrorKind::Configuration:  return "ConfigurationError";
            case ErrorKind::Internal:       return "InternalError";
            default:                        return "InternalError";
        }
    }

    inline std::optional<ErrorKind> kind_from_string(const std::string& name) {
        if (name == "ConnectivityError") return ErrorKind::Connectivity;
        if (name == "TimeoutError") return ErrorKind::Timeout;
        if (name == "DecodeError") return ErrorKind::Decode;
        if (name == "UnknownCommand") return ErrorKind::UnknownCommand;
        if (name == "HandlerError") return ErrorKind::Handler;
        if (name == "ShapeError") return ErrorKind::Shape;
        if (name == "ConfigurationError") return ErrorKind::Configuration;
        if (name == "InternalError") return ErrorKind::Internal;
        return std::nullopt;
    }

} // namespace hostbridge::core::errors
