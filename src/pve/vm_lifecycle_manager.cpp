#include "pve/vm_lifecycle_manager.hpp"
#include "common/logger.hpp"
#include "common/pve_errors.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <cstdint>

namespace {

void requireNonEmpty(const std::string& parameter, const std::string& value) {
    if (value.empty()) {
        throw ValidationError(parameter, value, "must not be empty");
    }
}

void requirePositive(const std::string& parameter, int value) {
    if (value <= 0) {
        throw ValidationError(parameter, std::to_string(value), "must be greater than zero");
    }
}

} // namespace

VmLifecycleManager::VmLifecycleManager(PveRestClient& client, ResourceAccessor& accessor)
    : client_(client), accessor_(accessor) {
}

void VmLifecycleManager::validateCreateSpec(const VmCreateSpec& spec) {
    if (spec.cpuType != kSupportedCpuType) {
        throw ValidationError("cpuType", spec.cpuType, std::string("expected ") + kSupportedCpuType);
    }
    if (spec.osType != kSupportedOsType) {
        throw ValidationError("osType", spec.osType, std::string("expected ") + kSupportedOsType);
    }
    requireNonEmpty("node", spec.node);
    requireNonEmpty("name", spec.name);
    requireNonEmpty("storage", spec.storage);
    requireNonEmpty("isoRef", spec.isoRef);
    requirePositive("memoryGB", spec.memoryGB);
    requirePositive("sockets", spec.sockets);
    requirePositive("cores", spec.cores);
    requirePositive("diskGB", spec.diskGB);
}

nlohmann::json VmLifecycleManager::buildCreateBody(const VmCreateSpec& spec, int vmid) {
    return {
        {"vmid", vmid},
        {"name", spec.name},
        {"memory", static_cast<int64_t>(spec.memoryGB) * 1024},
        {"cpu", spec.cpuType},
        {"sockets", spec.sockets},
        {"cores", spec.cores},
        {"ostype", spec.osType},
        {"scsihw", kDefaultScsiController},
        {"scsi0", spec.storage + ":" + std::to_string(spec.diskGB) + ",discard=on"},
        {"net0", kDefaultNetwork},
        {"ide2", spec.isoRef + ",media=cdrom"}
    };
}

int VmLifecycleManager::nextVmId(const std::string& node) {
    std::vector<VirtualMachine> vms = accessor_.listVMs(node);
    if (vms.empty()) {
        Logger::info("No VMs on node " + node + ", starting ids at " + std::to_string(kFirstVmId));
        return kFirstVmId;
    }

    auto highest = std::max_element(vms.begin(), vms.end(), [](const VirtualMachine& a, const VirtualMachine& b) {
        return a.vmid < b.vmid;
    });
    return highest->vmid + 1;
}

VirtualMachine VmLifecycleManager::createVM(const VmCreateSpec& spec) {
    validateCreateSpec(spec);

    int vmid = nextVmId(spec.node);
    nlohmann::json body = buildCreateBody(spec, vmid);

    Logger::info("Creating VM '" + spec.name + "' with id " + std::to_string(vmid) + " on node " + spec.node);
    nlohmann::json data = client_.post("/nodes/" + utils::urlEncode(spec.node) + "/qemu", body);

    VirtualMachine vm;
    vm.vmid = vmid;
    vm.name = spec.name;
    vm.status = "stopped";
    vm.additionalInfo = {{"task", data}};

    Logger::info("VM '" + spec.name + "' (" + std::to_string(vmid) + ") creation accepted");
    return vm;
}

std::string VmLifecycleManager::deleteVM(const std::string& node, const std::string& name) {
    VirtualMachine vm = accessor_.getVM(node, name);
    Logger::info("Deleting VM '" + name + "' (" + std::to_string(vm.vmid) + ") on node " + node);
    return taskId(client_.del(vmEndpoint(node, vm.vmid)));
}

std::string VmLifecycleManager::startVM(const std::string& node, const std::string& name) {
    VirtualMachine vm = accessor_.getVM(node, name);
    Logger::info("Starting VM '" + name + "' (" + std::to_string(vm.vmid) + ") on node " + node);
    return taskId(client_.post(vmEndpoint(node, vm.vmid) + "/status/start", nlohmann::json::object()));
}

std::string VmLifecycleManager::stopVM(const std::string& node, const std::string& name) {
    VirtualMachine vm = accessor_.getVM(node, name);
    // shutdown asks the guest to power off; it is not a forced stop
    Logger::info("Shutting down VM '" + name + "' (" + std::to_string(vm.vmid) + ") on node " + node);
    return taskId(client_.post(vmEndpoint(node, vm.vmid) + "/status/shutdown", nlohmann::json::object()));
}

std::string VmLifecycleManager::vmEndpoint(const std::string& node, int vmid) const {
    return "/nodes/" + utils::urlEncode(node) + "/qemu/" + std::to_string(vmid);
}

std::string VmLifecycleManager::taskId(const nlohmann::json& data) {
    if (data.is_string()) {
        return data.get<std::string>();
    }
    if (data.is_null()) {
        return "";
    }
    return data.dump();
}
