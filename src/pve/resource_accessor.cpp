#include "pve/resource_accessor.hpp"
#include "common/logger.hpp"
#include "common/pve_errors.hpp"
#include "common/utils.hpp"
#include <algorithm>

namespace {

std::string stringField(const nlohmann::json& item, const char* key) {
    auto it = item.find(key);
    if (it == item.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

// vmid is numeric in current releases but older ones sent it as a string
int vmidField(const nlohmann::json& item) {
    auto it = item.find("vmid");
    if (it == item.end()) {
        return 0;
    }
    if (it->is_number_integer()) {
        return it->get<int>();
    }
    if (it->is_string()) {
        try {
            return std::stoi(it->get<std::string>());
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

template <typename T>
const T& firstMatch(const std::vector<T>& matches, const std::string& resource, const std::string& value) {
    if (matches.size() > 1) {
        Logger::warning(std::to_string(matches.size()) + " " + resource + " entries match '" + value +
                        "', using the first one");
    }
    return matches.front();
}

} // namespace

ResourceAccessor::ResourceAccessor(PveRestClient& client)
    : client_(client) {
}

nlohmann::json ResourceAccessor::fetchList(const std::string& endpoint) {
    nlohmann::json data = client_.get(endpoint);
    if (!data.is_array()) {
        throw RequestError(client_.host(), "GET " + endpoint, "expected a list in the 'data' field");
    }
    return data;
}

Node ResourceAccessor::toNode(const nlohmann::json& item) {
    Node node;
    node.id = stringField(item, "id");
    node.status = stringField(item, "status");
    node.name = stringField(item, "node");
    return node;
}

Storage ResourceAccessor::toStorage(const nlohmann::json& item) {
    Storage storage;
    storage.name = stringField(item, "storage");
    storage.contentTypes = utils::split(stringField(item, "content"), ',');
    auto used = item.find("used_fraction");
    if (used != item.end() && used->is_number()) {
        storage.usedFraction = used->get<double>();
    }
    auto avail = item.find("avail");
    if (avail != item.end() && avail->is_number()) {
        storage.available = avail->get<int64_t>();
    }
    return storage;
}

VirtualMachine ResourceAccessor::toVirtualMachine(const nlohmann::json& item) {
    VirtualMachine vm;
    vm.vmid = vmidField(item);
    vm.name = stringField(item, "name");
    vm.status = stringField(item, "status");
    vm.additionalInfo = item;
    return vm;
}

std::vector<Node> ResourceAccessor::listNodes() {
    nlohmann::json data = fetchList("/nodes");

    std::vector<Node> nodes;
    nodes.reserve(data.size());
    for (const auto& item : data) {
        nodes.push_back(toNode(item));
    }
    Logger::debug("Found " + std::to_string(nodes.size()) + " nodes on " + client_.host());
    return nodes;
}

Node ResourceAccessor::getNode(const std::string& name) {
    std::vector<Node> matches;
    for (const auto& node : listNodes()) {
        if (node.name == name) {
            matches.push_back(node);
        }
    }
    if (matches.empty()) {
        throw NotFoundError(client_.host(), "Node", name);
    }
    return firstMatch(matches, "node", name);
}

std::vector<Storage> ResourceAccessor::listStorage(const std::string& node) {
    nlohmann::json data = fetchList("/nodes/" + utils::urlEncode(node) + "/storage");

    std::vector<Storage> storages;
    storages.reserve(data.size());
    for (const auto& item : data) {
        storages.push_back(toStorage(item));
    }
    return storages;
}

Storage ResourceAccessor::getStorage(const std::string& node, const std::string& name) {
    std::vector<Storage> matches;
    for (const auto& storage : listStorage(node)) {
        if (storage.name == name) {
            matches.push_back(storage);
        }
    }
    if (matches.empty()) {
        throw NotFoundError(client_.host(), "Storage", node + "/" + name);
    }
    return firstMatch(matches, "storage", name);
}

std::vector<ContentItem> ResourceAccessor::listContent(const std::string& node, const std::string& storage) {
    nlohmann::json data = fetchList("/nodes/" + utils::urlEncode(node) + "/storage/" +
                                    utils::urlEncode(storage) + "/content");
    return std::vector<ContentItem>(data.begin(), data.end());
}

ContentItem ResourceAccessor::getContent(const std::string& node, const std::string& storage,
                                         const std::string& volid) {
    std::vector<ContentItem> items = listContent(node, storage);
    auto it = std::find_if(items.begin(), items.end(), [&volid](const ContentItem& item) {
        return stringField(item, "volid") == volid;
    });
    if (it == items.end()) {
        throw NotFoundError(client_.host(), "Content", volid);
    }
    return *it;
}

std::vector<VirtualMachine> ResourceAccessor::listVMs(const std::string& node) {
    nlohmann::json data = fetchList("/nodes/" + utils::urlEncode(node) + "/qemu");

    std::vector<VirtualMachine> vms;
    vms.reserve(data.size());
    for (const auto& item : data) {
        vms.push_back(toVirtualMachine(item));
    }
    Logger::debug("Found " + std::to_string(vms.size()) + " VMs on node " + node);
    return vms;
}

VirtualMachine ResourceAccessor::getVM(const std::string& node, const std::string& name) {
    std::vector<VirtualMachine> matches;
    for (const auto& vm : listVMs(node)) {
        if (vm.name == name) {
            matches.push_back(vm);
        }
    }
    if (matches.empty()) {
        throw NotFoundError(client_.host(), "VM", name);
    }
    return firstMatch(matches, "VM", name);
}

VirtualMachine ResourceAccessor::getVMById(const std::string& node, int vmid) {
    for (const auto& vm : listVMs(node)) {
        if (vm.vmid == vmid) {
            return vm;
        }
    }
    throw NotFoundError(client_.host(), "VM", std::to_string(vmid));
}
