#include "core/config/bridge_config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <system_error>
#include <utility>

namespace hostbridge::core::config {

using errors::BridgeError;
using errors::ErrorKind;

namespace {

const char* env_value(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return nullptr;
    }
    return value;
}

}  // namespace

errors::Result<std::uint64_t> parse_unsigned(const std::string& text,
                                             const std::string& source,
                                             const std::uint64_t min_value,
                                             const std::uint64_t max_value) {
    std::uint64_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (text.empty() || ec != std::errc() || ptr != end) {
        return BridgeError{ErrorKind::Configuration,
                           "Invalid number for " + source + ": " + text,
                           "invalid_config", "Provide a non-negative integer."};
    }
    if (value < min_value || value > max_value) {
        return BridgeError{ErrorKind::Configuration,
                           source + " out of bounds: " + text, "invalid_config",
                           "Must be between " + std::to_string(min_value) +
                               " and " + std::to_string(max_value) + "."};
    }
    return value;
}

errors::Result<std::uint16_t> parse_port(const std::string& text,
                                         const std::string& source) {
    auto parsed = parse_unsigned(text, source, 0,
                                 std::numeric_limits<std::uint16_t>::max());
    if (errors::is_error(parsed)) {
        return errors::get_error(parsed);
    }
    return static_cast<std::uint16_t>(errors::get_value(parsed));
}

errors::Result<bool> parse_flag(const std::string& text,
                                const std::string& source) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        return false;
    }
    return BridgeError{ErrorKind::Configuration,
                       "Invalid boolean for " + source + ": " + text,
                       "invalid_config", "Use 1/0, true/false, yes/no or on/off."};
}

errors::Result<BridgeConfig> load_config_from_env(BridgeConfig base) {
    BridgeConfig config = std::move(base);

    if (const char* host = env_value("HOSTBRIDGE_HOST")) {
        config.host = host;
    }

    if (const char* port = env_value("HOSTBRIDGE_PORT")) {
        auto parsed = parse_port(port, "HOSTBRIDGE_PORT");
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        config.port = errors::get_value(parsed);
    }

    if (const char* timeout = env_value("HOSTBRIDGE_TIMEOUT_MS")) {
        auto parsed = parse_unsigned(timeout, "HOSTBRIDGE_TIMEOUT_MS", 1,
                                     24u * 60u * 60u * 1000u);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        config.timeout_ms = static_cast<std::uint32_t>(errors::get_value(parsed));
    }

    if (const char* batch = env_value("HOSTBRIDGE_MAX_BATCH")) {
        auto parsed = parse_unsigned(batch, "HOSTBRIDGE_MAX_BATCH", 1, 1024);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        config.max_batch = static_cast<std::size_t>(errors::get_value(parsed));
    }

    if (const char* tick = env_value("HOSTBRIDGE_TICK_MS")) {
        auto parsed = parse_unsigned(tick, "HOSTBRIDGE_TICK_MS", 1, 10000);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        config.tick_interval_ms = static_cast<std::uint32_t>(errors::get_value(parsed));
    }

    if (const char* max_bytes = env_value("HOSTBRIDGE_MAX_MESSAGE_BYTES")) {
        auto parsed = parse_unsigned(max_bytes, "HOSTBRIDGE_MAX_MESSAGE_BYTES",
                                     1024, 1024ull * 1024ull * 1024ull);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        config.max_message_bytes = static_cast<std::size_t>(errors::get_value(parsed));
    }

    if (const char* keep_alive = env_value("HOSTBRIDGE_KEEP_ALIVE")) {
        auto parsed = parse_flag(keep_alive, "HOSTBRIDGE_KEEP_ALIVE");
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        config.keep_alive = errors::get_value(parsed);
    }

    if (const char* secrets = env_value("HOSTBRIDGE_SECRETS_FILE")) {
        config.secrets_file = secrets;
    }

    return config;
}

}  // namespace hostbridge::core::config
