#include "pve/pve_rest_client.hpp"
#include "common/logger.hpp"
#include "common/pve_errors.hpp"
#include <stdexcept>
#include <utility>

PveRestClient::PveRestClient(std::shared_ptr<HttpTransport> transport, Session session)
    : transport_(std::move(transport)), session_(std::move(session)) {
    if (!transport_) {
        throw std::invalid_argument("PveRestClient requires a transport");
    }
}

nlohmann::json PveRestClient::get(const std::string& endpoint) {
    return makeRequest("GET", endpoint, nullptr);
}

nlohmann::json PveRestClient::post(const std::string& endpoint, const nlohmann::json& body) {
    return makeRequest("POST", endpoint, &body);
}

nlohmann::json PveRestClient::del(const std::string& endpoint) {
    return makeRequest("DELETE", endpoint, nullptr);
}

nlohmann::json PveRestClient::version() {
    return get("/version");
}

std::string PveRestClient::buildUrl(const std::string& endpoint) const {
    return session_.baseUri + endpoint;
}

std::string PveRestClient::describeHttpFailure(long status, const std::string& body) {
    std::string cause = "HTTP " + std::to_string(status);

    nlohmann::json parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return cause;
    }

    if (parsed.contains("message") && parsed["message"].is_string()) {
        cause += ": " + parsed["message"].get<std::string>();
    }
    // Parameter verification failures come back as {"errors": {"param": "reason"}}
    if (parsed.contains("errors") && parsed["errors"].is_object()) {
        for (const auto& item : parsed["errors"].items()) {
            std::string reason = item.value().is_string() ? item.value().get<std::string>() : item.value().dump();
            cause += "; " + item.key() + ": " + reason;
        }
    }
    return cause;
}

nlohmann::json PveRestClient::makeRequest(const std::string& method, const std::string& endpoint,
                                          const nlohmann::json* body) {
    HttpRequest request;
    request.method = method;
    request.url = buildUrl(endpoint);
    request.headers.push_back(session_.authHeader);
    request.headers.push_back("Accept: application/json");
    if (body) {
        request.headers.push_back("Content-Type: application/json");
        request.body = body->dump();
    }

    Logger::debug("Making " + method + " request to: " + request.url);
    if (body) {
        Logger::debug("Request body: " + request.body);
    }

    HttpResponse response;
    std::string transportError;
    if (!transport_->perform(request, response, transportError)) {
        Logger::error(method + " " + endpoint + " failed: " + transportError);
        throw RequestError(session_.serverHost, method + " " + endpoint, transportError);
    }

    Logger::debug("Response code: " + std::to_string(response.status));

    if (response.status < 200 || response.status >= 300) {
        std::string cause = describeHttpFailure(response.status, response.body);
        Logger::error(method + " " + endpoint + " failed: " + cause);
        throw RequestError(session_.serverHost, method + " " + endpoint, cause, response.status);
    }

    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        Logger::error("Failed to parse response of " + method + " " + endpoint + ": " + e.what());
        throw RequestError(session_.serverHost, method + " " + endpoint,
                           std::string("invalid JSON response: ") + e.what(), response.status);
    }

    if (!parsed.is_object() || !parsed.contains("data")) {
        Logger::error("Response of " + method + " " + endpoint + " has no data envelope");
        throw RequestError(session_.serverHost, method + " " + endpoint,
                           "response is missing the 'data' field", response.status);
    }

    return parsed["data"];
}

Session PveConnector::buildSession(const std::string& host, const std::string& tokenId, const std::string& secret) {
    Session session;
    session.serverHost = host;
    session.baseUri = "https://" + host + ":" + std::to_string(kPveApiPort) + kPveApiBasePath;
    session.authHeader = "Authorization: PVEAPIToken=" + tokenId + "=" + secret;
    return session;
}

Session PveConnector::connect(const std::shared_ptr<HttpTransport>& transport, const std::string& host,
                              const std::string& tokenId, const std::string& secret) {
    if (host.empty()) {
        throw ValidationError("host", host, "must not be empty");
    }
    if (tokenId.empty()) {
        throw ValidationError("tokenId", tokenId, "must not be empty");
    }
    if (secret.empty()) {
        throw ValidationError("secret", "", "must not be empty");
    }

    Logger::info("Connecting to Proxmox VE at " + host + " with token " + tokenId);
    Session session = buildSession(host, tokenId, secret);

    try {
        PveRestClient probe(transport, session);
        nlohmann::json version = probe.version();
        if (version.is_object() && version.contains("version") && version["version"].is_string()) {
            Logger::info("Connected to " + host + ", server version " + version["version"].get<std::string>());
        } else {
            Logger::info("Connected to " + host);
        }
    } catch (const RequestError& e) {
        throw AuthError(host, e.cause());
    }

    return session;
}
