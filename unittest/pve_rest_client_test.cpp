#include <gtest/gtest.h>
#include "pve/pve_rest_client.hpp"
#include "common/pve_errors.hpp"
#include "mock_transport.hpp"
#include <algorithm>
#include <memory>

class PveRestClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<MockTransport>();
        session_ = PveConnector::buildSession("pve01.lab", "root@pam!ci", "s3cr3t");
    }

    std::shared_ptr<MockTransport> transport_;
    Session session_;
};

static bool hasHeader(const HttpRequest& request, const std::string& header) {
    return std::find(request.headers.begin(), request.headers.end(), header) != request.headers.end();
}

TEST_F(PveRestClientTest, BuildSession) {
    EXPECT_EQ(session_.baseUri, "https://pve01.lab:8006/api2/json");
    EXPECT_EQ(session_.serverHost, "pve01.lab");
    EXPECT_EQ(session_.authHeader, "Authorization: PVEAPIToken=root@pam!ci=s3cr3t");
}

TEST_F(PveRestClientTest, ConnectProbesVersion) {
    transport_->respondData({{"version", "8.2.4"}, {"release", "8.2"}, {"repoid", "faa83925"}});

    Session session = PveConnector::connect(transport_, "pve01.lab", "root@pam!ci", "s3cr3t");

    EXPECT_EQ(session.baseUri, "https://pve01.lab:8006/api2/json");
    ASSERT_EQ(transport_->requests.size(), 1u);
    EXPECT_EQ(transport_->last().method, "GET");
    EXPECT_EQ(transport_->last().url, "https://pve01.lab:8006/api2/json/version");
    EXPECT_TRUE(hasHeader(transport_->last(), "Authorization: PVEAPIToken=root@pam!ci=s3cr3t"));
}

TEST_F(PveRestClientTest, ConnectRejectsUnauthorized) {
    transport_->respond(401, "");

    try {
        PveConnector::connect(transport_, "pve01.lab", "root@pam!ci", "wrong");
        FAIL() << "expected AuthError";
    } catch (const AuthError& e) {
        EXPECT_EQ(e.host(), "pve01.lab");
        EXPECT_NE(e.cause().find("401"), std::string::npos);
    }
}

TEST_F(PveRestClientTest, ConnectReportsUnreachableHost) {
    transport_->fail("Couldn't connect to server");

    EXPECT_THROW(PveConnector::connect(transport_, "10.0.0.99", "root@pam!ci", "s3cr3t"), AuthError);
}

TEST_F(PveRestClientTest, ConnectRejectsMissingEnvelope) {
    transport_->respond(200, R"({"version": "8.2.4"})");

    EXPECT_THROW(PveConnector::connect(transport_, "pve01.lab", "root@pam!ci", "s3cr3t"), AuthError);
}

TEST_F(PveRestClientTest, ConnectValidatesCredentialsBeforeProbing) {
    EXPECT_THROW(PveConnector::connect(transport_, "pve01.lab", "", "s3cr3t"), ValidationError);
    EXPECT_THROW(PveConnector::connect(transport_, "", "root@pam!ci", "s3cr3t"), ValidationError);
    EXPECT_TRUE(transport_->requests.empty());
}

TEST_F(PveRestClientTest, GetUnwrapsData) {
    PveRestClient client(transport_, session_);
    transport_->respondData(nlohmann::json::array({{{"node", "pve01"}}}));

    nlohmann::json data = client.get("/nodes");

    ASSERT_TRUE(data.is_array());
    EXPECT_EQ(data[0]["node"], "pve01");
    EXPECT_EQ(transport_->last().url, "https://pve01.lab:8006/api2/json/nodes");
    EXPECT_TRUE(transport_->last().body.empty());
}

TEST_F(PveRestClientTest, PostSendsJsonBody) {
    PveRestClient client(transport_, session_);
    transport_->respondData("UPID:pve01:0001:start");

    nlohmann::json data = client.post("/nodes/pve01/qemu/100/status/start", {{"timeout", 30}});

    EXPECT_EQ(data, "UPID:pve01:0001:start");
    EXPECT_EQ(transport_->last().method, "POST");
    EXPECT_TRUE(hasHeader(transport_->last(), "Content-Type: application/json"));
    EXPECT_EQ(nlohmann::json::parse(transport_->last().body)["timeout"], 30);
}

TEST_F(PveRestClientTest, NullDataIsAccepted) {
    PveRestClient client(transport_, session_);
    transport_->respond(200, R"({"data": null})");

    EXPECT_TRUE(client.del("/nodes/pve01/qemu/100").is_null());
    EXPECT_EQ(transport_->last().method, "DELETE");
}

TEST_F(PveRestClientTest, ServerErrorBecomesRequestError) {
    PveRestClient client(transport_, session_);
    transport_->respond(400, R"({"data": null, "errors": {"vmid": "VM 101 already exists"}})");

    try {
        client.post("/nodes/pve01/qemu", {{"vmid", 101}});
        FAIL() << "expected RequestError";
    } catch (const RequestError& e) {
        EXPECT_EQ(e.httpStatus(), 400);
        EXPECT_EQ(e.host(), "pve01.lab");
        EXPECT_EQ(e.endpoint(), "POST /nodes/pve01/qemu");
        EXPECT_NE(e.cause().find("VM 101 already exists"), std::string::npos);
    }
}

TEST_F(PveRestClientTest, TransportFailureBecomesRequestError) {
    PveRestClient client(transport_, session_);
    transport_->fail("Operation timed out after 60000 milliseconds");

    try {
        client.get("/nodes");
        FAIL() << "expected RequestError";
    } catch (const RequestError& e) {
        EXPECT_EQ(e.httpStatus(), 0);
        EXPECT_NE(e.cause().find("timed out"), std::string::npos);
    }
}

TEST_F(PveRestClientTest, InvalidJsonBecomesRequestError) {
    PveRestClient client(transport_, session_);
    transport_->respond(200, "<html>proxy error</html>");

    EXPECT_THROW(client.get("/nodes"), RequestError);
}

TEST_F(PveRestClientTest, MissingDataBecomesRequestError) {
    PveRestClient client(transport_, session_);
    transport_->respond(200, R"({"result": []})");

    EXPECT_THROW(client.get("/nodes"), RequestError);
}
