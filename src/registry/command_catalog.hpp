#pragma once

#include <vector>
#include "registry/command_spec.hpp"

namespace hostbridge::registry {

// Names and shapes of every command the modeling host exposes. The host
// binds its handlers to these; the gateway checks calls against them.
std::vector<CommandSpec> host_command_specs();

}  // namespace hostbridge::registry
