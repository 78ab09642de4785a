#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "common/http_transport.hpp"
#include "common/logger.hpp"

// Connection and logging settings for the pvectl tool.
//
// JSON file keys: host, token_id, secret, connect_timeout, timeout,
// verify_tls, log_file, log_level. Unknown keys are ignored.
struct ClientConfig {
    std::string host;
    std::string tokenId;  // user@realm!tokenname
    std::string secret;
    long connectTimeoutSec = 10;
    long timeoutSec = 60;
    bool verifyTls = false;
    std::string logPath;  // empty: no log file, nothing logged
    LogLevel logLevel = LogLevel::WARNING;

    TransportConfig toTransportConfig() const;
};

// Throws ValidationError when the file cannot be read or a key has the wrong type
ClientConfig loadClientConfig(const std::string& path);

// Applies the keys present in json on top of config
void applyClientConfig(const nlohmann::json& json, ClientConfig& config);
