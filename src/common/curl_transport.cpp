#include "common/curl_transport.hpp"
#include "common/logger.hpp"
#include <memory>
#include <mutex>
#include <stdexcept>

namespace {

std::once_flag curlInitFlag;

struct CurlEasyDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

} // namespace

CurlTransport::CurlTransport(const TransportConfig& config)
    : config_(config) {
    std::call_once(curlInitFlag, []() {
        if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
    });

    if (!config_.verifyTls) {
        Logger::warning("TLS certificate verification is disabled for API requests");
    }
    Logger::debug("CURL transport configured: connect timeout " + std::to_string(config_.connectTimeoutSec) +
                  "s, operation timeout " + std::to_string(config_.timeoutSec) + "s");
}

size_t CurlTransport::writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t realsize = size * nmemb;
    userp->append(static_cast<char*>(contents), realsize);
    return realsize;
}

CurlTransport::TlsOptions CurlTransport::tlsOptions(const TransportConfig& config) {
    TlsOptions options;
    options.verifyPeer = config.verifyTls ? 1L : 0L;
    options.verifyHost = config.verifyTls ? 2L : 0L;
    return options;
}

bool CurlTransport::perform(const HttpRequest& request, HttpResponse& response, std::string& errorMessage) {
    if (request.method != "GET" && request.method != "POST" && request.method != "DELETE") {
        errorMessage = "Unsupported HTTP method: " + request.method;
        return false;
    }

    // A fresh handle per request; nothing is pooled between calls
    CurlEasyPtr curl(curl_easy_init());
    if (!curl) {
        errorMessage = "Failed to initialize CURL handle";
        return false;
    }

    curl_slist* rawHeaders = nullptr;
    for (const auto& header : request.headers) {
        curl_slist* appended = curl_slist_append(rawHeaders, header.c_str());
        if (!appended) {
            curl_slist_free_all(rawHeaders);
            errorMessage = "Failed to build request headers";
            return false;
        }
        rawHeaders = appended;
    }
    CurlSlistPtr headers(rawHeaders);

    response.status = 0;
    response.body.clear();

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, config_.connectTimeoutSec);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, config_.timeoutSec);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    TlsOptions tls = tlsOptions(config_);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, tls.verifyPeer);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, tls.verifyHost);

    if (request.method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    } else if (request.method == "DELETE") {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, "DELETE");
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        errorMessage = curl_easy_strerror(res);
        return false;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return true;
}
