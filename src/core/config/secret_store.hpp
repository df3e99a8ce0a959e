#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/bridge_errors.hpp"

namespace hostbridge::core::config {

// Credentials read from a local, untracked JSON file such as
// {"REPLICATE_API_TOKEN": "r8_..."}. Values never leave the process in logs
// or response envelopes; callers register values() for redaction.
class SecretStore {
public:
    SecretStore() = default;
    explicit SecretStore(std::map<std::string, std::string> secrets);

    // A missing file yields an empty store. An unreadable file, invalid JSON,
    // a non-object document or a non-string value is a configuration error.
    static errors::Result<SecretStore> load(const std::filesystem::path& path);

    std::optional<std::string> get(const std::string& key) const;
    bool contains(const std::string& key) const;
    std::vector<std::string> values() const;
    std::size_t size() const { return secrets_.size(); }

private:
    std::map<std::string, std::string> secrets_;
};

}  // namespace hostbridge::core::config
