#pragma once

#include <string>
#include <curl/curl.h>
#include "common/http_transport.hpp"

class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(const TransportConfig& config = TransportConfig());
    ~CurlTransport() override = default;

    bool perform(const HttpRequest& request, HttpResponse& response, std::string& errorMessage) override;

    const TransportConfig& config() const { return config_; }

    // Values for CURLOPT_SSL_VERIFYPEER / CURLOPT_SSL_VERIFYHOST
    struct TlsOptions {
        long verifyPeer;
        long verifyHost;
    };
    static TlsOptions tlsOptions(const TransportConfig& config);

private:
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp);

    TransportConfig config_;
};
