#include "common/client_config.hpp"
#include "common/pve_errors.hpp"
#include <fstream>

namespace {

template <typename T>
bool readKey(const nlohmann::json& json, const char* key, T& value) {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return false;
    }
    try {
        value = it->get<T>();
    } catch (const nlohmann::json::type_error& e) {
        throw ValidationError(key, it->dump(), std::string("wrong type: ") + e.what());
    }
    return true;
}

} // namespace

TransportConfig ClientConfig::toTransportConfig() const {
    TransportConfig transport;
    transport.connectTimeoutSec = connectTimeoutSec;
    transport.timeoutSec = timeoutSec;
    transport.verifyTls = verifyTls;
    return transport;
}

void applyClientConfig(const nlohmann::json& json, ClientConfig& config) {
    if (!json.is_object()) {
        throw ValidationError("config", json.dump(), "expected a JSON object");
    }

    readKey(json, "host", config.host);
    readKey(json, "token_id", config.tokenId);
    readKey(json, "secret", config.secret);
    readKey(json, "connect_timeout", config.connectTimeoutSec);
    readKey(json, "timeout", config.timeoutSec);
    readKey(json, "verify_tls", config.verifyTls);
    readKey(json, "log_file", config.logPath);

    std::string level;
    if (readKey(json, "log_level", level) && !Logger::parseLevel(level, config.logLevel)) {
        throw ValidationError("log_level", level, "expected debug, info, warning, error or fatal");
    }

    if (config.connectTimeoutSec <= 0) {
        throw ValidationError("connect_timeout", std::to_string(config.connectTimeoutSec), "must be positive");
    }
    if (config.timeoutSec <= 0) {
        throw ValidationError("timeout", std::to_string(config.timeoutSec), "must be positive");
    }
}

ClientConfig loadClientConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ValidationError("config", path, "cannot open file");
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError("config", path, std::string("invalid JSON: ") + e.what());
    }

    ClientConfig config;
    applyClientConfig(json, config);
    return config;
}
