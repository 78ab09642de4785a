#pragma once

#include "common/http_transport.hpp"
#include <deque>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Records every request and answers from a queue of canned replies.
// An empty queue answers as an unreachable host.
class MockTransport : public HttpTransport {
public:
    struct Reply {
        bool delivered;
        long status;
        std::string body;
        std::string error;
    };

    void respond(long status, const std::string& body) {
        replies_.push_back({true, status, body, ""});
    }

    void respondData(const nlohmann::json& data, long status = 200) {
        respond(status, nlohmann::json{{"data", data}}.dump());
    }

    void fail(const std::string& error) {
        replies_.push_back({false, 0, "", error});
    }

    bool perform(const HttpRequest& request, HttpResponse& response, std::string& errorMessage) override {
        requests.push_back(request);
        if (replies_.empty()) {
            errorMessage = "Could not resolve host";
            return false;
        }
        Reply reply = replies_.front();
        replies_.pop_front();
        if (!reply.delivered) {
            errorMessage = reply.error;
            return false;
        }
        response.status = reply.status;
        response.body = reply.body;
        return true;
    }

    const HttpRequest& last() const { return requests.back(); }

    std::vector<HttpRequest> requests;

private:
    std::deque<Reply> replies_;
};
