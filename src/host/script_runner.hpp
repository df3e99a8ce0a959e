#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include "core/errors/bridge_errors.hpp"

namespace hostbridge::host {

struct ScriptRequest {
    std::string code;
    std::filesystem::path working_directory = ".";
    std::uint32_t timeout_ms = 10000;
    // Fed to the script's standard input, which is then closed. Empty
    // leaves stdin inherited.
    std::string stdin_text;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

struct ScriptOutcome {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;

    bool succeeded() const { return exit_code == 0 && !timed_out && !cancelled; }
};

// Runs `code` through /bin/sh -c in a child process, capturing both output
// streams. The child runs in its own process group so a timeout or cancel
// kills anything it spawned. No sandboxing of any kind is applied.
core::errors::Result<ScriptOutcome> run_script(const ScriptRequest& request);

}  // namespace hostbridge::host
