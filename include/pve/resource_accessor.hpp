#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "pve/pve_rest_client.hpp"
#include "pve/pve_types.hpp"

// Read-only listings. Each call issues exactly one GET; filters are exact,
// case-sensitive matches over the returned list and the first match wins.
// A filter that matches nothing throws NotFoundError.
class ResourceAccessor {
public:
    explicit ResourceAccessor(PveRestClient& client);

    // GET /nodes
    std::vector<Node> listNodes();
    Node getNode(const std::string& name);

    // GET /nodes/{node}/storage
    std::vector<Storage> listStorage(const std::string& node);
    Storage getStorage(const std::string& node, const std::string& name);

    // GET /nodes/{node}/storage/{storage}/content
    std::vector<ContentItem> listContent(const std::string& node, const std::string& storage);
    ContentItem getContent(const std::string& node, const std::string& storage, const std::string& volid);

    // GET /nodes/{node}/qemu
    std::vector<VirtualMachine> listVMs(const std::string& node);
    VirtualMachine getVM(const std::string& node, const std::string& name);
    VirtualMachine getVMById(const std::string& node, int vmid);

    static Node toNode(const nlohmann::json& item);
    static Storage toStorage(const nlohmann::json& item);
    static VirtualMachine toVirtualMachine(const nlohmann::json& item);

private:
    nlohmann::json fetchList(const std::string& endpoint);

    PveRestClient& client_;
};
