#pragma once

#include <string>
#include <memory>
#include <nlohmann/json.hpp>
#include "common/http_transport.hpp"
#include "pve/pve_types.hpp"

// Common request contract for every API call: builds the URL from the
// session, attaches the token header, maps failures to RequestError and
// unwraps the {"data": ...} envelope.
class PveRestClient {
public:
    PveRestClient(std::shared_ptr<HttpTransport> transport, Session session);
    ~PveRestClient() = default;

    const Session& session() const { return session_; }
    const std::string& host() const { return session_.serverHost; }

    nlohmann::json get(const std::string& endpoint);
    nlohmann::json post(const std::string& endpoint, const nlohmann::json& body);
    nlohmann::json del(const std::string& endpoint);

    // GET /version: {version, release, repoid}
    nlohmann::json version();

private:
    nlohmann::json makeRequest(const std::string& method, const std::string& endpoint,
                               const nlohmann::json* body);
    std::string buildUrl(const std::string& endpoint) const;
    static std::string describeHttpFailure(long status, const std::string& body);

    std::shared_ptr<HttpTransport> transport_;
    Session session_;
};

class PveConnector {
public:
    // Builds the session descriptor without touching the network
    static Session buildSession(const std::string& host, const std::string& tokenId, const std::string& secret);

    // Builds the session and probes GET /version with it. Throws AuthError if
    // the probe fails for any reason; never returns an unverified session.
    static Session connect(const std::shared_ptr<HttpTransport>& transport, const std::string& host,
                           const std::string& tokenId, const std::string& secret);
};
