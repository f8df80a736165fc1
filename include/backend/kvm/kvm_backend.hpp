#pragma once

#include <memory>
#include <string>
#include <vector>
#include "backend/hypervisor_backend.hpp"
#include "backend/kvm/domain_inventory.hpp"
#include "common/command_runner.hpp"
#include "common/controller_config.hpp"

class KvmBackend : public HypervisorBackend {
public:
    KvmBackend(const KvmConfig& config, CommandRunner& runner, std::unique_ptr<DomainInventory> inventory);
    ~KvmBackend() override;

    std::string name() const override { return "kvm"; }

    Result<InstanceInventory> listInstances() override;
    Result<VmState> getState(const std::string& vmName) override;
    Result<std::string> getIpAddress(const std::string& vmName) override;

    Status start(const std::string& vmName) override;
    Status shutdown(const std::string& vmName) override;
    Status forceStop(const std::string& vmName) override;
    Status reset(const std::string& vmName) override;
    Status reboot(const std::string& vmName) override;

    Status undefine(const std::string& vmName) override;
    Status removeInstanceFiles(const std::string& vmName) override;

    Result<std::vector<DiskResource>> listDisks(const std::string& vmName) override;
    Result<std::vector<std::string>> listTargets(const std::string& vmName) override;
    Result<std::string> createDiskImage(const std::string& vmName, const std::string& diskName,
                                        uint64_t sizeBytes) override;
    Status attachDisk(const std::string& vmName, const DiskAttachment& disk, bool live) override;
    Status detachDisk(const std::string& vmName, const DiskResource& disk, bool live) override;
    Status deleteDiskImage(const std::string& location) override;
    Status resizeDiskImage(const std::string& location, uint64_t deltaBytes) override;
    Status ejectMedia(const std::string& vmName, const std::string& target) override;
    Status removeMediaDevice(const std::string& vmName, const std::string& target, bool live) override;

    Result<std::vector<NetworkInterface>> listInterfaces(const std::string& vmName, bool running) override;
    Status attachInterface(const std::string& vmName, const InterfaceSpec& spec, bool live) override;
    Status detachInterface(const std::string& vmName, const std::string& mac, bool live) override;

    std::string vmDirectory(const std::string& vmName) const;

private:
    Result<std::string> virsh(const std::vector<std::string>& args, bool logFailure = true);
    Result<std::string> qemuImg(const std::vector<std::string>& args);
    // Writes xml to a scratch file, runs `virsh <verb> <vm> <file> [--live] --persistent`.
    Status applyDeviceXml(const std::string& verb, const std::string& vmName, const std::string& xml, bool live);

    KvmConfig config_;
    CommandRunner& runner_;
    std::unique_ptr<DomainInventory> inventory_;
};
