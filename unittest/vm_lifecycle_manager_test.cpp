#include <gtest/gtest.h>
#include "pve/vm_lifecycle_manager.hpp"
#include "common/pve_errors.hpp"
#include "mock_transport.hpp"
#include <cstdint>
#include <memory>

class VmLifecycleManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<MockTransport>();
        client_ = std::make_unique<PveRestClient>(transport_, PveConnector::buildSession("pve01.lab", "root@pam!ci", "s3cr3t"));
        accessor_ = std::make_unique<ResourceAccessor>(*client_);
        manager_ = std::make_unique<VmLifecycleManager>(*client_, *accessor_);

        spec_.node = "pve01";
        spec_.name = "test-vm";
        spec_.memoryGB = 4;
        spec_.cpuType = "x86-64-v2-AES";
        spec_.sockets = 1;
        spec_.cores = 2;
        spec_.osType = "l26";
        spec_.storage = "local-lvm";
        spec_.diskGB = 20;
        spec_.isoRef = "local:iso/ubuntu.iso";
    }

    std::shared_ptr<MockTransport> transport_;
    std::unique_ptr<PveRestClient> client_;
    std::unique_ptr<ResourceAccessor> accessor_;
    std::unique_ptr<VmLifecycleManager> manager_;
    VmCreateSpec spec_;
};

TEST_F(VmLifecycleManagerTest, CreateVMBuildsRequest) {
    transport_->respondData(nlohmann::json::array({{{"vmid", 100}, {"name", "dns"}}}));
    transport_->respondData("UPID:pve01:00002F00:qmcreate:101");

    VirtualMachine vm = manager_->createVM(spec_);

    EXPECT_EQ(vm.vmid, 101);
    EXPECT_EQ(vm.name, "test-vm");
    EXPECT_EQ(vm.additionalInfo["task"], "UPID:pve01:00002F00:qmcreate:101");

    ASSERT_EQ(transport_->requests.size(), 2u);
    EXPECT_EQ(transport_->requests[0].method, "GET");
    EXPECT_EQ(transport_->requests[0].url, "https://pve01.lab:8006/api2/json/nodes/pve01/qemu");
    EXPECT_EQ(transport_->requests[1].method, "POST");
    EXPECT_EQ(transport_->requests[1].url, "https://pve01.lab:8006/api2/json/nodes/pve01/qemu");

    nlohmann::json body = nlohmann::json::parse(transport_->requests[1].body);
    EXPECT_EQ(body["vmid"], 101);
    EXPECT_EQ(body["name"], "test-vm");
    EXPECT_EQ(body["memory"], 4096);
    EXPECT_EQ(body["cpu"], "x86-64-v2-AES");
    EXPECT_EQ(body["sockets"], 1);
    EXPECT_EQ(body["cores"], 2);
    EXPECT_EQ(body["ostype"], "l26");
    EXPECT_EQ(body["scsihw"], "virtio-scsi-single");
    EXPECT_EQ(body["scsi0"], "local-lvm:20,discard=on");
    EXPECT_EQ(body["net0"], "virtio,bridge=vmbr0");
    EXPECT_EQ(body["ide2"], "local:iso/ubuntu.iso,media=cdrom");
}

TEST_F(VmLifecycleManagerTest, LargeMemoryConvertsWithoutOverflow) {
    spec_.memoryGB = 3000000;

    nlohmann::json body = VmLifecycleManager::buildCreateBody(spec_, 101);

    EXPECT_EQ(body["memory"].get<int64_t>(), 3072000000LL);
}

TEST_F(VmLifecycleManagerTest, NextIdIsHighestPlusOne) {
    transport_->respondData(nlohmann::json::array({{{"vmid", 100}}, {{"vmid", 250}}, {{"vmid", 104}}}));

    EXPECT_EQ(manager_->nextVmId("pve01"), 251);
}

TEST_F(VmLifecycleManagerTest, NextIdOnEmptyNode) {
    transport_->respondData(nlohmann::json::array());

    EXPECT_EQ(manager_->nextVmId("pve01"), 100);
}

TEST_F(VmLifecycleManagerTest, InvalidCpuTypeSendsNothing) {
    spec_.cpuType = "host";

    EXPECT_THROW(manager_->createVM(spec_), ValidationError);
    EXPECT_TRUE(transport_->requests.empty());
}

TEST_F(VmLifecycleManagerTest, InvalidOsTypeSendsNothing) {
    spec_.osType = "win11";

    try {
        manager_->createVM(spec_);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.parameter(), "osType");
        EXPECT_EQ(e.value(), "win11");
    }
    EXPECT_TRUE(transport_->requests.empty());
}

TEST_F(VmLifecycleManagerTest, NonPositiveSizesRejected) {
    spec_.memoryGB = 0;
    EXPECT_THROW(manager_->createVM(spec_), ValidationError);

    spec_.memoryGB = 4;
    spec_.diskGB = -1;
    EXPECT_THROW(manager_->createVM(spec_), ValidationError);
    EXPECT_TRUE(transport_->requests.empty());
}

TEST_F(VmLifecycleManagerTest, CreateFailureIsRequestError) {
    transport_->respondData(nlohmann::json::array({{{"vmid", 100}}}));
    transport_->respond(500, R"({"data": null, "message": "unable to create VM 101"})");

    EXPECT_THROW(manager_->createVM(spec_), RequestError);
}

TEST_F(VmLifecycleManagerTest, StartResolvesName) {
    transport_->respondData(nlohmann::json::array({{{"vmid", 100}, {"name", "dns"}}, {{"vmid", 107}, {"name", "web"}}}));
    transport_->respondData("UPID:pve01:00003000:qmstart:107");

    std::string task = manager_->startVM("pve01", "web");

    EXPECT_EQ(task, "UPID:pve01:00003000:qmstart:107");
    ASSERT_EQ(transport_->requests.size(), 2u);
    EXPECT_EQ(transport_->last().method, "POST");
    EXPECT_EQ(transport_->last().url, "https://pve01.lab:8006/api2/json/nodes/pve01/qemu/107/status/start");
}

TEST_F(VmLifecycleManagerTest, StopUsesGracefulShutdown) {
    transport_->respondData(nlohmann::json::array({{{"vmid", 107}, {"name", "web"}}}));
    transport_->respondData("UPID:pve01:00003001:qmshutdown:107");

    manager_->stopVM("pve01", "web");

    EXPECT_EQ(transport_->last().url, "https://pve01.lab:8006/api2/json/nodes/pve01/qemu/107/status/shutdown");
}

TEST_F(VmLifecycleManagerTest, StopUnknownNameSendsNoShutdown) {
    transport_->respondData(nlohmann::json::array({{{"vmid", 107}, {"name", "web"}}}));

    EXPECT_THROW(manager_->stopVM("pve01", "db"), NotFoundError);
    ASSERT_EQ(transport_->requests.size(), 1u);
    EXPECT_EQ(transport_->last().method, "GET");
}

TEST_F(VmLifecycleManagerTest, DeleteIssuesDelete) {
    transport_->respondData(nlohmann::json::array({{{"vmid", 107}, {"name", "web"}}}));
    transport_->respond(200, R"({"data": null})");

    std::string task = manager_->deleteVM("pve01", "web");

    EXPECT_TRUE(task.empty());
    EXPECT_EQ(transport_->last().method, "DELETE");
    EXPECT_EQ(transport_->last().url, "https://pve01.lab:8006/api2/json/nodes/pve01/qemu/107");
}
