#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "registry/command_spec.hpp"

namespace hostbridge::registry {

// A handler receives normalized params and returns a JSON result or an
// error. Handlers run only on the host's execution turn.
using CommandHandler =
    std::function<core::errors::Result<nlohmann::json>(const nlohmann::json& params)>;

struct CommandEntry {
    CommandSpec spec;
    CommandHandler handler;
};

// Name -> entry table, built once at startup and immutable afterwards, so
// connection threads may look entries up without locking.
class CommandRegistry {
public:
    // Rejects empty names, duplicate names and entries without a handler.
    static core::errors::Result<CommandRegistry> build(std::vector<CommandEntry> entries);

    const CommandEntry* find(const std::string& name) const;
    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;
    std::vector<CommandSpec> specs() const;
    std::size_t size() const { return entries_.size(); }

private:
    CommandRegistry() = default;

    std::vector<CommandEntry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

// Pairs each spec with the handler of the same name in `handlers`. A spec
// without a handler, or a handler without a spec, fails the build.
core::errors::Result<CommandRegistry> bind_handlers(
    const std::vector<CommandSpec>& specs,
    std::unordered_map<std::string, CommandHandler> handlers);

}  // namespace hostbridge::registry
