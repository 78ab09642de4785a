#pragma once

#include <string>
#include <vector>

struct HttpRequest {
    std::string method;                // GET, POST, DELETE
    std::string url;
    std::vector<std::string> headers;  // complete "Name: value" lines
    std::string body;                  // empty for GET and DELETE
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

struct TransportConfig {
    long connectTimeoutSec = 10;
    long timeoutSec = 60;
    // Proxmox hosts ship self-signed certificates, so validation is off
    // unless the caller turns it on. Callers must decide this explicitly
    // for their own deployment.
    bool verifyTls = false;
};

// One-shot HTTP exchange. Implementations return false and fill errorMessage
// when no HTTP response was received; any received status is a success here.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual bool perform(const HttpRequest& request, HttpResponse& response, std::string& errorMessage) = 0;
};
