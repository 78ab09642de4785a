#include "main/pvectl_cli.hpp"
#include "common/curl_transport.hpp"
#include "common/logger.hpp"
#include "common/pve_errors.hpp"
#include "pve/content_uploader.hpp"
#include "pve/resource_accessor.hpp"
#include "pve/vm_lifecycle_manager.hpp"
#include <limits>
#include <set>
#include <stdexcept>
#include <utility>

namespace {

const std::set<std::string> kCommands = {
    "version", "nodes", "storage", "content", "add-content",
    "vms", "create-vm", "delete-vm", "start-vm", "stop-vm"
};

long parseLong(const std::string& option, const std::string& value) {
    try {
        size_t pos = 0;
        long result = std::stol(value, &pos);
        if (pos != value.size()) {
            throw ValidationError(option, value, "not a number");
        }
        return result;
    } catch (const std::invalid_argument&) {
        throw ValidationError(option, value, "not a number");
    } catch (const std::out_of_range&) {
        throw ValidationError(option, value, "out of range");
    }
}

int parseInt(const std::string& option, const std::string& value) {
    long result = parseLong(option, value);
    if (result < std::numeric_limits<int>::min() || result > std::numeric_limits<int>::max()) {
        throw ValidationError(option, value, "out of range");
    }
    return static_cast<int>(result);
}

} // namespace

PveCli::PveCli(TransportFactory factory, std::ostream& out, std::ostream& err)
    : factory_(std::move(factory)), out_(out), err_(err) {
}

void PveCli::printUsage() const {
    out_ << "Usage: pvectl [options] <command> [command options]\n"
         << "Commands:\n"
         << "  version                                   Show the server version\n"
         << "  nodes [--name N]                          List cluster nodes\n"
         << "  storage --node N [--name S]               List storage of a node\n"
         << "  content --node N --storage S [--volid V]  List stored content\n"
         << "  add-content --node N --storage S --kind iso|vztmpl|import --file F --url U\n"
         << "                                            Download a file into a storage\n"
         << "  vms --node N [--name V | --vmid ID]       List virtual machines\n"
         << "  create-vm --node N --name V --memory GB --cpu x86-64-v2-AES --sockets N\n"
         << "            --cores N --ostype l26 --storage S --disk GB --iso REF\n"
         << "                                            Create a virtual machine\n"
         << "  delete-vm --node N --name V               Delete a virtual machine\n"
         << "  start-vm --node N --name V                Start a virtual machine\n"
         << "  stop-vm --node N --name V                 Shut down a virtual machine\n"
         << "\n"
         << "Options:\n"
         << "  -h, --help             Show this help message\n"
         << "  --version              Show version information\n"
         << "  --config FILE          JSON configuration file\n"
         << "  --host HOST            Proxmox VE host name or address\n"
         << "  --token-id ID          API token id (user@realm!token)\n"
         << "  --secret SECRET        API token secret\n"
         << "  --timeout SEC          Request timeout in seconds\n"
         << "  --connect-timeout SEC  Connection timeout in seconds\n"
         << "  --verify-tls           Validate the server certificate\n"
         << "  --log-file FILE        Write log messages to FILE\n"
         << "  --log-level LEVEL      debug, info, warning, error or fatal\n";
}

bool PveCli::parseArguments(int argc, char* argv[], CliOptions& options, std::string& error) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "--version") {
            options.version = true;
        } else if (arg == "--verify-tls") {
            options.verifyTls = true;
        } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            if (i + 1 >= argc) {
                error = "Missing value for " + arg;
                return false;
            }
            std::string key = arg.substr(2);
            if (key == "config") {
                options.configPath = argv[++i];
            } else {
                options.values[key] = argv[++i];
            }
        } else if (options.command.empty()) {
            options.command = arg;
        } else {
            error = "Unexpected argument: " + arg;
            return false;
        }
    }
    return true;
}

ClientConfig PveCli::resolveConfig(const CliOptions& options) {
    ClientConfig config;
    if (!options.configPath.empty()) {
        config = loadClientConfig(options.configPath);
    }

    std::string value;
    if (!(value = optional(options, "host")).empty()) {
        config.host = value;
    }
    if (!(value = optional(options, "token-id")).empty()) {
        config.tokenId = value;
    }
    if (!(value = optional(options, "secret")).empty()) {
        config.secret = value;
    }
    if (!(value = optional(options, "timeout")).empty()) {
        config.timeoutSec = parseLong("--timeout", value);
    }
    if (!(value = optional(options, "connect-timeout")).empty()) {
        config.connectTimeoutSec = parseLong("--connect-timeout", value);
    }
    if (!(value = optional(options, "log-file")).empty()) {
        config.logPath = value;
    }
    if (!(value = optional(options, "log-level")).empty() && !Logger::parseLevel(value, config.logLevel)) {
        throw ValidationError("--log-level", value, "expected debug, info, warning, error or fatal");
    }
    if (options.verifyTls) {
        config.verifyTls = true;
    }

    if (config.timeoutSec <= 0) {
        throw ValidationError("--timeout", std::to_string(config.timeoutSec), "must be positive");
    }
    if (config.connectTimeoutSec <= 0) {
        throw ValidationError("--connect-timeout", std::to_string(config.connectTimeoutSec), "must be positive");
    }
    return config;
}

int PveCli::run(int argc, char* argv[]) {
    CliOptions options;
    std::string error;
    if (!parseArguments(argc, argv, options, error)) {
        err_ << "Error: " << error << std::endl;
        printUsage();
        return 2;
    }

    if (options.help) {
        printUsage();
        return 0;
    }
    if (options.version) {
        out_ << "pvectl version 1.0.0" << std::endl;
        return 0;
    }
    if (options.command.empty()) {
        err_ << "Error: No command specified" << std::endl;
        printUsage();
        return 2;
    }
    if (kCommands.count(options.command) == 0) {
        err_ << "Error: Unknown command: " << options.command << std::endl;
        printUsage();
        return 2;
    }

    try {
        ClientConfig config = resolveConfig(options);
        if (!config.logPath.empty() && !Logger::isInitialized()) {
            if (!Logger::initialize(config.logPath, config.logLevel)) {
                err_ << "Warning: logging to " << config.logPath << " is disabled" << std::endl;
            }
        }
        return execute(options, config);
    } catch (const ValidationError& e) {
        err_ << "Error: " << e.what() << std::endl;
        return 2;
    } catch (const PveError& e) {
        Logger::error(e.what());
        err_ << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int PveCli::execute(const CliOptions& options, const ClientConfig& config) {
    TransportConfig transportConfig = config.toTransportConfig();
    std::shared_ptr<HttpTransport> transport;
    if (factory_) {
        transport = factory_(transportConfig);
    } else {
        transport = std::make_shared<CurlTransport>(transportConfig);
    }

    Session session = PveConnector::connect(transport, config.host, config.tokenId, config.secret);
    PveRestClient client(transport, session);

    nlohmann::json result = dispatch(options, client);
    out_ << result.dump(2) << std::endl;
    return 0;
}

nlohmann::json PveCli::dispatch(const CliOptions& options, PveRestClient& client) {
    const std::string& command = options.command;
    ResourceAccessor accessor(client);

    if (command == "version") {
        return client.version();
    }

    if (command == "nodes") {
        std::string name = optional(options, "name");
        if (!name.empty()) {
            return accessor.getNode(name);
        }
        return accessor.listNodes();
    }

    if (command == "storage") {
        const std::string& node = require(options, "node");
        std::string name = optional(options, "name");
        if (!name.empty()) {
            return accessor.getStorage(node, name);
        }
        return accessor.listStorage(node);
    }

    if (command == "content") {
        const std::string& node = require(options, "node");
        const std::string& storage = require(options, "storage");
        std::string volid = optional(options, "volid");
        if (!volid.empty()) {
            return accessor.getContent(node, storage, volid);
        }
        return accessor.listContent(node, storage);
    }

    if (command == "add-content") {
        ContentUploader uploader(client);
        return uploader.addContent(require(options, "node"), require(options, "storage"),
                                   require(options, "kind"), require(options, "file"),
                                   require(options, "url"));
    }

    if (command == "vms") {
        const std::string& node = require(options, "node");
        std::string name = optional(options, "name");
        if (!name.empty()) {
            return accessor.getVM(node, name);
        }
        std::string vmid = optional(options, "vmid");
        if (!vmid.empty()) {
            return accessor.getVMById(node, parseInt("--vmid", vmid));
        }
        return accessor.listVMs(node);
    }

    VmLifecycleManager manager(client, accessor);

    if (command == "create-vm") {
        VmCreateSpec spec;
        spec.node = require(options, "node");
        spec.name = require(options, "name");
        spec.memoryGB = requireInt(options, "memory");
        spec.cpuType = require(options, "cpu");
        spec.sockets = requireInt(options, "sockets");
        spec.cores = requireInt(options, "cores");
        spec.osType = require(options, "ostype");
        spec.storage = require(options, "storage");
        spec.diskGB = requireInt(options, "disk");
        spec.isoRef = require(options, "iso");
        return manager.createVM(spec);
    }

    const std::string& node = require(options, "node");
    const std::string& name = require(options, "name");
    std::string task;
    if (command == "delete-vm") {
        task = manager.deleteVM(node, name);
    } else if (command == "start-vm") {
        task = manager.startVM(node, name);
    } else {
        task = manager.stopVM(node, name);
    }
    return nlohmann::json{{"name", name}, {"node", node}, {"task", task}};
}

const std::string& PveCli::require(const CliOptions& options, const std::string& key) {
    auto it = options.values.find(key);
    if (it == options.values.end() || it->second.empty()) {
        throw ValidationError("--" + key, "", "is required for this command");
    }
    return it->second;
}

std::string PveCli::optional(const CliOptions& options, const std::string& key) {
    auto it = options.values.find(key);
    return it == options.values.end() ? std::string() : it->second;
}

int PveCli::requireInt(const CliOptions& options, const std::string& key) {
    return parseInt("--" + key, require(options, key));
}
