#pragma once

#include <string>
#include <vector>
#include "core/errors/bridge_errors.hpp"
#include "protocol/envelope_contract.hpp"

namespace hostbridge::protocol {

// One envelope per line of UTF-8 JSON. Encoders never emit a raw newline:
// newlines inside strings are escaped by the JSON serializer.

core::errors::Result<CommandEnvelope> decode_command(const std::string& line);
std::string encode_command(const CommandEnvelope& command);

core::errors::Result<ResponseEnvelope> decode_response(const std::string& line);
std::string encode_response(const ResponseEnvelope& response);

// Replaces every occurrence of each secret in the strings (keys included)
// of the result and error message.
void redact_response(ResponseEnvelope& response,
                     const std::vector<std::string>& secrets);

}  // namespace hostbridge::protocol
