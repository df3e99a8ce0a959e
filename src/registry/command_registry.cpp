#include "registry/command_registry.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace hostbridge::registry {

using core::errors::BridgeError;
using core::errors::ErrorKind;

core::errors::Result<CommandRegistry> CommandRegistry::build(
    std::vector<CommandEntry> entries) {
    CommandRegistry registry;
    registry.entries_.reserve(entries.size());

    for (auto& entry : entries) {
        if (entry.spec.name.empty()) {
            return BridgeError{ErrorKind::Internal,
                               "Command name cannot be empty.", "invalid_registry"};
        }
        if (!entry.handler) {
            return BridgeError{ErrorKind::Internal,
                               "Command has no handler: " + entry.spec.name,
                               "invalid_registry"};
        }
        if (registry.index_.count(entry.spec.name) != 0) {
            return BridgeError{ErrorKind::Internal,
                               "Duplicate command name: " + entry.spec.name,
                               "invalid_registry"};
        }
        registry.index_.emplace(entry.spec.name, registry.entries_.size());
        registry.entries_.push_back(std::move(entry));
    }

    LOG_DEBUG("CommandRegistry: built with " + std::to_string(registry.entries_.size()) +
              " commands");
    return registry;
}

const CommandEntry* CommandRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &entries_[it->second];
}

bool CommandRegistry::contains(const std::string& name) const {
    return find(name) != nullptr;
}

std::vector<std::string> CommandRegistry::names() const {
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& entry : entries_) {
        names.push_back(entry.spec.name);
    }
    return names;
}

std::vector<CommandSpec> CommandRegistry::specs() const {
    std::vector<CommandSpec> specs;
    specs.reserve(entries_.size());
    for (const auto& entry : entries_) {
        specs.push_back(entry.spec);
    }
    return specs;
}

core::errors::Result<CommandRegistry> bind_handlers(
    const std::vector<CommandSpec>& specs,
    std::unordered_map<std::string, CommandHandler> handlers) {
    std::vector<CommandEntry> entries;
    entries.reserve(specs.size());
    for (const auto& spec : specs) {
        auto it = handlers.find(spec.name);
        if (it == handlers.end()) {
            return BridgeError{ErrorKind::Internal,
                               "No handler bound for command: " + spec.name,
                               "invalid_registry"};
        }
        entries.push_back(CommandEntry{spec, std::move(it->second)});
        handlers.erase(it);
    }

    if (!handlers.empty()) {
        return BridgeError{ErrorKind::Internal,
                           "Handler has no command spec: " + handlers.begin()->first,
                           "invalid_registry"};
    }
    return CommandRegistry::build(std::move(entries));
}

}  // namespace hostbridge::registry
