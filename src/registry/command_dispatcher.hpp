#pragma once

#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "protocol/envelope_contract.hpp"
#include "registry/command_registry.hpp"

namespace hostbridge::registry {

// A command whose name resolved and whose params passed the shape check.
struct ResolvedCall {
    const CommandEntry* entry = nullptr;
    nlohmann::json params = nlohmann::json::object();
};

class CommandDispatcher {
public:
    explicit CommandDispatcher(const CommandRegistry& registry);

    // Exact, case-sensitive lookup plus shape validation. Safe to call from
    // any thread; never runs a handler.
    core::errors::Result<ResolvedCall> resolve(
        const protocol::CommandEnvelope& command) const;

    // Runs the handler and maps whatever happens to a response envelope.
    // Must only be called on the host's execution turn.
    static protocol::ResponseEnvelope invoke(const ResolvedCall& call);

    // resolve() followed by invoke(), for callers already on the host turn.
    protocol::ResponseEnvelope dispatch(const protocol::CommandEnvelope& command) const;

    const CommandRegistry& registry() const { return registry_; }

private:
    const CommandRegistry& registry_;
};

}  // namespace hostbridge::registry
