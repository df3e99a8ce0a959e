#include "core/config/secret_store.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>

namespace hostbridge::core::config {

using errors::BridgeError;
using errors::ErrorKind;
using nlohmann::json;

SecretStore::SecretStore(std::map<std::string, std::string> secrets)
    : secrets_(std::move(secrets)) {}

errors::Result<SecretStore> SecretStore::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        return SecretStore{};
    }
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return BridgeError{ErrorKind::Configuration,
                           "Secrets path is not a regular file: " + path.string(),
                           "invalid_secrets_file"};
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return BridgeError{ErrorKind::Configuration,
                           "Unable to open secrets file: " + path.string(),
                           "secrets_open_failed"};
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    const json document = json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded()) {
        return BridgeError{ErrorKind::Configuration,
                           "Secrets file is not valid JSON: " + path.string(),
                           "invalid_secrets_file"};
    }
    if (!document.is_object()) {
        return BridgeError{ErrorKind::Configuration,
                           "Secrets file must contain a JSON object: " + path.string(),
                           "invalid_secrets_file"};
    }

    std::map<std::string, std::string> secrets;
    for (const auto& [key, value] : document.items()) {
        if (!value.is_string()) {
            // the key is safe to report, the value is not
            return BridgeError{ErrorKind::Configuration,
                               "Secret '" + key + "' must be a string.",
                               "invalid_secrets_file"};
        }
        secrets.emplace(key, value.get<std::string>());
    }
    return SecretStore{std::move(secrets)};
}

std::optional<std::string> SecretStore::get(const std::string& key) const {
    auto it = secrets_.find(key);
    if (it == secrets_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

bool SecretStore::contains(const std::string& key) const {
    return get(key).has_value();
}

std::vector<std::string> SecretStore::values() const {
    std::vector<std::string> values;
    values.reserve(secrets_.size());
    for (const auto& entry : secrets_) {
        if (!entry.second.empty()) {
            values.push_back(entry.second);
        }
    }
    return values;
}

}  // namespace hostbridge::core::config
