#pragma once

#include "common/client_config.hpp"
#include "common/http_transport.hpp"
#include "pve/pve_rest_client.hpp"
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <string>

using TransportFactory = std::function<std::shared_ptr<HttpTransport>(const TransportConfig&)>;

struct CliOptions {
    std::string command;
    std::string configPath;
    std::map<std::string, std::string> values;  // --key value pairs, without the dashes
    bool verifyTls = false;
    bool help = false;
    bool version = false;
};

class PveCli {
public:
    // Without a factory, requests go through CurlTransport
    explicit PveCli(TransportFactory factory = TransportFactory(),
                    std::ostream& out = std::cout, std::ostream& err = std::cerr);

    // Returns the process exit code: 0 success, 1 failure, 2 usage error
    int run(int argc, char* argv[]);
    void printUsage() const;

    // Returns false and fills error on malformed arguments
    static bool parseArguments(int argc, char* argv[], CliOptions& options, std::string& error);

    // Config file first, then command line overrides
    static ClientConfig resolveConfig(const CliOptions& options);

private:
    int execute(const CliOptions& options, const ClientConfig& config);
    nlohmann::json dispatch(const CliOptions& options, PveRestClient& client);

    static const std::string& require(const CliOptions& options, const std::string& key);
    static std::string optional(const CliOptions& options, const std::string& key);
    static int requireInt(const CliOptions& options, const std::string& key);

    TransportFactory factory_;
    std::ostream& out_;
    std::ostream& err_;
};
