#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/bridge_errors.hpp"

namespace hostbridge::core::config {

// Settings shared by the host bridge and the tool gateway. Defaults match
// the original Rhino listener (localhost:9876, 30 s client timeout).
struct BridgeConfig {
    std::string host = "127.0.0.1";
    std::uint16_t port = 9876;
    std::uint32_t timeout_ms = 30000;
    std::size_t max_batch = 8;
    std::uint32_t tick_interval_ms = 10;
    std::size_t max_message_bytes = 16 * 1024 * 1024;
    bool keep_alive = true;
    std::filesystem::path secrets_file = ".hostbridge_secrets.json";
};

// Applies HOSTBRIDGE_* environment overrides on top of `base`.
errors::Result<BridgeConfig> load_config_from_env(BridgeConfig base = {});

// Parsers shared by the env loader and the CLI front ends.
errors::Result<std::uint16_t> parse_port(const std::string& text,
                                         const std::string& source);
errors::Result<std::uint64_t> parse_unsigned(const std::string& text,
                                             const std::string& source,
                                             std::uint64_t min_value,
                                             std::uint64_t max_value);
errors::Result<bool> parse_flag(const std::string& text,
                                const std::string& source);

}  // namespace hostbridge::core::config
