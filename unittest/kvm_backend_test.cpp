#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "backend/kvm/kvm_backend.hpp"
#include "common/utils.hpp"
#include "fake_command_runner.hpp"

namespace fs = std::filesystem;

class KvmBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        vmDir_ = fs::path(::testing::TempDir()) / ("vmsteward-kvm-" + utils::randomHex(8));
        config_.vmDir = vmDir_.string();
        backend_ = std::make_unique<KvmBackend>(config_, runner_, nullptr);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(vmDir_, ec);
    }

    KvmConfig config_;
    FakeCommandRunner runner_;
    fs::path vmDir_;
    std::unique_ptr<KvmBackend> backend_;
};

TEST_F(KvmBackendTest, PowerCommands) {
    EXPECT_TRUE(backend_->start("web01").isOk());
    EXPECT_TRUE(backend_->shutdown("web01").isOk());
    EXPECT_TRUE(backend_->forceStop("web01").isOk());
    EXPECT_TRUE(backend_->reset("web01").isOk());
    EXPECT_TRUE(backend_->reboot("web01").isOk());
    EXPECT_TRUE(backend_->undefine("web01").isOk());

    EXPECT_EQ(runner_.lines(), std::vector<std::string>({
        "virsh start web01", "virsh shutdown web01", "virsh destroy web01",
        "virsh reset web01", "virsh reboot web01", "virsh undefine web01"}));
}

TEST_F(KvmBackendTest, FailedCommandIsTransportFailure) {
    runner_.respond("virsh start", 1, "", "error: Requested operation is not valid");
    Status status = backend_->start("web01");
    ASSERT_TRUE(status.isErr());
    EXPECT_EQ(status.kind(), ErrorKind::TransportFailure);
    EXPECT_NE(status.message().find("not valid"), std::string::npos);
}

TEST_F(KvmBackendTest, InventoryFromVirsh) {
    runner_.respond("virsh list", 0, " Id   Name   State\n----\n 1    web01  running\n -    db01   shut off\n");
    auto inventory = backend_->listInstances();
    ASSERT_TRUE(inventory.isOk());
    EXPECT_EQ(inventory.unwrap().stateOf("web01"), VmState::Running);
    EXPECT_EQ(inventory.unwrap().stateOf("db01"), VmState::Stopped);
    EXPECT_EQ(runner_.calls[0].line(), "virsh list --all");
}

TEST_F(KvmBackendTest, UnknownDomainIsNotFound) {
    runner_.respond("virsh dominfo", 1, "", "error: failed to get domain 'ghost'");
    auto state = backend_->getState("ghost");
    ASSERT_TRUE(state.isErr());
    EXPECT_EQ(state.kind(), ErrorKind::NotFound);
}

TEST_F(KvmBackendTest, CreateDiskImageOfExactSize) {
    auto location = backend_->createDiskImage("web01", "data1", 5368709120ULL);
    ASSERT_TRUE(location.isOk());
    std::string expected = (vmDir_ / "web01" / "data1.qcow2").string();
    EXPECT_EQ(location.unwrap(), expected);
    EXPECT_TRUE(fs::is_directory(vmDir_ / "web01"));
    EXPECT_EQ(runner_.calls.back().line(), "qemu-img create -f qcow2 " + expected + " 5368709120");
}

TEST_F(KvmBackendTest, CreateDiskImageRefusesExistingFile) {
    fs::create_directories(vmDir_ / "web01");
    std::ofstream(vmDir_ / "web01" / "data1.qcow2") << "x";
    auto location = backend_->createDiskImage("web01", "data1", 1024);
    ASSERT_TRUE(location.isErr());
    EXPECT_EQ(location.kind(), ErrorKind::StateConflict);
    EXPECT_TRUE(runner_.calls.empty());
}

TEST_F(KvmBackendTest, AttachDiskCommandShape) {
    DiskAttachment disk{"/k2g/vms/web01/data1.qcow2", "sdb", "web01-data1"};
    ASSERT_TRUE(backend_->attachDisk("web01", disk, false).isOk());
    ASSERT_TRUE(backend_->attachDisk("web01", disk, true).isOk());

    const std::string base = "virsh attach-disk web01 /k2g/vms/web01/data1.qcow2 --driver qemu --subdriver qcow2 "
                             "--cache none --serial web01-data1 --target sdb --targetbus scsi";
    EXPECT_EQ(runner_.calls[0].line(), base + " --persistent");
    EXPECT_EQ(runner_.calls[1].line(), base + " --live --persistent");
}

TEST_F(KvmBackendTest, DetachDiskUsesScratchDescriptor) {
    DiskResource disk{"sdb", "/k2g/vms/web01/data1.qcow2", "web01-data1", 0};
    ASSERT_TRUE(backend_->detachDisk("web01", disk, true).isOk());

    const auto& args = runner_.calls[0].args;
    ASSERT_EQ(args.size(), 5u);
    EXPECT_EQ(args[0], "detach-device");
    EXPECT_EQ(args[1], "web01");
    EXPECT_EQ(args[3], "--live");
    EXPECT_EQ(args[4], "--persistent");
    EXPECT_FALSE(fs::exists(args[2]));
}

TEST_F(KvmBackendTest, ResizeAndMediaCommands) {
    ASSERT_TRUE(backend_->resizeDiskImage("/k2g/vms/web01/data1.qcow2", 5368709120ULL).isOk());
    ASSERT_TRUE(backend_->ejectMedia("web01", "sdc").isOk());
    ASSERT_TRUE(backend_->removeMediaDevice("web01", "sdc", false).isOk());

    EXPECT_EQ(runner_.lines(), std::vector<std::string>({
        "qemu-img resize /k2g/vms/web01/data1.qcow2 +5368709120",
        "virsh change-media web01 sdc --eject --config",
        "virsh detach-disk web01 sdc --config"}));
}

TEST_F(KvmBackendTest, ListDisksReadsCapacity) {
    runner_.respond("virsh domblklist", 0,
                    " Target   Source\n------\n sda      /k2g/vms/web01/boot.qcow2\n"
                    " sdb      /k2g/vms/web01/data1.qcow2\n");
    runner_.respond("virsh domblkinfo", 0, "Capacity:       10737418240\nAllocation:     1\n");

    auto disks = backend_->listDisks("web01");
    ASSERT_TRUE(disks.isOk());
    ASSERT_EQ(disks.unwrap().size(), 2u);
    EXPECT_EQ(disks.unwrap()[0].serial, "web01-boot");
    EXPECT_TRUE(disks.unwrap()[0].isBootDisk());
    EXPECT_EQ(disks.unwrap()[1].serial, "web01-data1");
    EXPECT_EQ(disks.unwrap()[1].sizeBytes, 10737418240ULL);
    EXPECT_EQ(runner_.calls[2].line(), "virsh domblkinfo web01 sdb");
}

TEST_F(KvmBackendTest, TargetsCoverEmptyDrives) {
    runner_.respond("virsh domblklist", 0,
                    " Target   Source\n------\n sda      /k2g/vms/web01/boot.qcow2\n sdb      -\n");
    auto targets = backend_->listTargets("web01");
    ASSERT_TRUE(targets.isOk());
    EXPECT_EQ(targets.unwrap(), std::vector<std::string>({"sda", "sdb"}));
    EXPECT_EQ(runner_.lines(), std::vector<std::string>({"virsh domblklist web01"}));
}

TEST_F(KvmBackendTest, AddressOfPrimaryInterface) {
    runner_.respond("virsh guestinfo", 0,
                    "if.0.name : lo\nif.0.addr.0.type : ipv4\nif.0.addr.0.addr : 127.0.0.1\n"
                    "if.1.name : eth0\nif.1.addr.0.type : ipv4\nif.1.addr.0.addr : 192.168.122.45\n");
    auto ip = backend_->getIpAddress("web01");
    ASSERT_TRUE(ip.isOk());
    EXPECT_EQ(ip.unwrap(), "192.168.122.45");
}

TEST_F(KvmBackendTest, InterfacesFromDefinitionWhenStopped) {
    runner_.respond("virsh dumpxml", 0,
                    "<domain><devices><interface type='bridge'><mac address='52:54:00:11:22:33'/>"
                    "<source bridge='virbr0'/><model type='virtio'/></interface></devices></domain>");
    auto interfaces = backend_->listInterfaces("web01", false);
    ASSERT_TRUE(interfaces.isOk());
    ASSERT_EQ(interfaces.unwrap().size(), 1u);
    EXPECT_EQ(interfaces.unwrap()[0].mac, "52:54:00:11:22:33");
    EXPECT_EQ(runner_.calls[0].line(), "virsh dumpxml web01");
}

TEST_F(KvmBackendTest, InterfaceAttachAndDetach) {
    ASSERT_TRUE(backend_->attachInterface("web01", {"virbr0", "virtio"}, true).isOk());
    ASSERT_TRUE(backend_->detachInterface("web01", "52:54:00:11:22:33", false).isOk());

    EXPECT_EQ(runner_.calls[0].args[0], "attach-device");
    EXPECT_EQ(runner_.calls[0].args.back(), "--persistent");
    EXPECT_EQ(runner_.calls[0].args[3], "--live");
    EXPECT_EQ(runner_.calls[1].args[0], "detach-device");
    EXPECT_EQ(runner_.calls[1].args.size(), 4u);
}

TEST_F(KvmBackendTest, RemoveInstanceFilesDeletesVmDirectory) {
    fs::create_directories(vmDir_ / "web01");
    std::ofstream(vmDir_ / "web01" / "boot.qcow2") << "x";
    ASSERT_TRUE(backend_->removeInstanceFiles("web01").isOk());
    EXPECT_FALSE(fs::exists(vmDir_ / "web01"));
}
