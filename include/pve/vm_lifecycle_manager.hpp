#pragma once

#include <string>
#include "pve/pve_rest_client.hpp"
#include "pve/resource_accessor.hpp"
#include "pve/pve_types.hpp"

constexpr const char* kSupportedCpuType = "x86-64-v2-AES";
constexpr const char* kSupportedOsType = "l26";
constexpr const char* kDefaultScsiController = "virtio-scsi-single";
constexpr const char* kDefaultNetwork = "virtio,bridge=vmbr0";
// Lowest vmid Proxmox VE accepts; used when a node has no VMs yet
constexpr int kFirstVmId = 100;

// Creates, deletes, starts and stops QEMU VMs. None of the calls wait for
// the server task to finish; they return once the request is accepted.
//
// Neither id assignment nor name resolution is atomic: nextVmId() reads the
// current list and createVM() writes later, and delete/start/stop act on
// whatever id the name resolved to at call time. Callers that may run
// concurrently against one node must serialize these calls themselves.
class VmLifecycleManager {
public:
    VmLifecycleManager(PveRestClient& client, ResourceAccessor& accessor);

    VirtualMachine createVM(const VmCreateSpec& spec);

    // Each returns the server's task id (UPID), empty if none was sent
    std::string deleteVM(const std::string& node, const std::string& name);
    std::string startVM(const std::string& node, const std::string& name);
    std::string stopVM(const std::string& node, const std::string& name);

    // max(existing vmid) + 1, or kFirstVmId on an empty node
    int nextVmId(const std::string& node);

    static void validateCreateSpec(const VmCreateSpec& spec);
    static nlohmann::json buildCreateBody(const VmCreateSpec& spec, int vmid);

private:
    std::string vmEndpoint(const std::string& node, int vmid) const;
    static std::string taskId(const nlohmann::json& data);

    PveRestClient& client_;
    ResourceAccessor& accessor_;
};
