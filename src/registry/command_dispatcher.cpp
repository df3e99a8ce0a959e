#include "registry/command_dispatcher.hpp"

#include <exception>
#include "core/logging/logger.hpp"

namespace hostbridge::registry {

using core::errors::BridgeError;
using core::errors::ErrorKind;
using protocol::ResponseEnvelope;

CommandDispatcher::CommandDispatcher(const CommandRegistry& registry)
    : registry_(registry) {}

core::errors::Result<ResolvedCall> CommandDispatcher::resolve(
    const protocol::CommandEnvelope& command) const {
    const CommandEntry* entry = registry_.find(command.name);
    if (entry == nullptr) {
        return BridgeError{ErrorKind::UnknownCommand,
                           "Unknown command: " + command.name, "unknown_command"};
    }

    auto normalized = validate_params(entry->spec, command.params);
    if (core::errors::is_error(normalized)) {
        return core::errors::get_error(normalized);
    }
    return ResolvedCall{entry, core::errors::get_value(normalized)};
}

ResponseEnvelope CommandDispatcher::invoke(const ResolvedCall& call) {
    if (call.entry == nullptr || !call.entry->handler) {
        return ResponseEnvelope::failure(ErrorKind::Internal,
                                         "Call has no resolved handler.");
    }

    const std::string& name = call.entry->spec.name;
    try {
        auto outcome = call.entry->handler(call.params);
        if (core::errors::is_error(outcome)) {
            const auto& err = core::errors::get_error(outcome);
            // handler-side parameter checks keep their kind; everything else
            // a handler reports is a HandlerError
            const ErrorKind kind =
                err.kind == ErrorKind::Shape ? ErrorKind::Shape : ErrorKind::Handler;
            LOG_WARN("Dispatch: " + name + " failed [" + err.code + "]: " + err.message);
            return ResponseEnvelope::failure(kind, err.message);
        }
        return ResponseEnvelope::success(core::errors::get_value(outcome));
    } catch (const std::exception& e) {
        LOG_ERROR("Dispatch: " + name + " threw: " + e.what());
        return ResponseEnvelope::failure(ErrorKind::Handler, e.what());
    } catch (...) {
        LOG_ERROR("Dispatch: " + name + " threw a non-standard exception");
        return ResponseEnvelope::failure(ErrorKind::Handler,
                                         "Handler raised a non-standard exception.");
    }
}

ResponseEnvelope CommandDispatcher::dispatch(
    const protocol::CommandEnvelope& command) const {
    auto resolved = resolve(command);
    if (core::errors::is_error(resolved)) {
        return ResponseEnvelope::failure(core::errors::get_error(resolved));
    }
    return invoke(core::errors::get_value(resolved));
}

}  // namespace hostbridge::registry
