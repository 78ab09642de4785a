#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

constexpr int kPveApiPort = 8006;
constexpr const char* kPveApiBasePath = "/api2/json";

// Authenticated context for every API call. Immutable once connected.
struct Session {
    std::string baseUri;     // https://{host}:8006/api2/json
    std::string authHeader;  // full "Authorization: ..." header line
    std::string serverHost;
};

struct Node {
    std::string id;
    std::string status;
    std::string name;
};

struct Storage {
    std::string name;
    std::vector<std::string> contentTypes;
    double usedFraction = 0.0;
    int64_t available = 0;
};

// Stored artifact metadata, passed through exactly as the server sent it
using ContentItem = nlohmann::json;

struct VirtualMachine {
    int vmid = 0;
    std::string name;
    std::string status;
    nlohmann::json additionalInfo;
};

enum class ContentKind {
    Iso,
    Template,
    Import
};

// Parameters for VmLifecycleManager::createVM
struct VmCreateSpec {
    std::string node;
    std::string name;
    int memoryGB = 0;
    std::string cpuType;
    int sockets = 1;
    int cores = 1;
    std::string osType;
    std::string storage;
    int diskGB = 0;
    std::string isoRef;  // e.g. "local:iso/ubuntu.iso"
};

inline void to_json(nlohmann::json& j, const Node& node) {
    j = nlohmann::json{{"id", node.id}, {"status", node.status}, {"name", node.name}};
}

inline void to_json(nlohmann::json& j, const Storage& storage) {
    j = nlohmann::json{
        {"name", storage.name},
        {"contentTypes", storage.contentTypes},
        {"usedFraction", storage.usedFraction},
        {"available", storage.available}
    };
}

// Server fields first, then the projected ones on top
inline void to_json(nlohmann::json& j, const VirtualMachine& vm) {
    j = vm.additionalInfo.is_object() ? vm.additionalInfo : nlohmann::json::object();
    j["vmid"] = vm.vmid;
    j["name"] = vm.name;
    j["status"] = vm.status;
}
