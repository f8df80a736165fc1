#pragma once

#include <memory>
#include <string>
#include <vector>
#include "backend/gcp/compute_api.hpp"
#include "backend/gcp/operation_poller.hpp"
#include "backend/hypervisor_backend.hpp"
#include "common/controller_config.hpp"

class GcpBackend : public HypervisorBackend {
public:
    GcpBackend(const GcpConfig& config, std::unique_ptr<ComputeApi> api, Poller poller);

    std::string name() const override { return "gcp"; }

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

    // RUNNING -> Running; TERMINATED, STOPPED, STOPPING -> Stopped;
    // SUSPENDED, SUSPENDING -> Paused; anything else Undefined.
    static VmState stateFromStatus(const std::string& status);
    // Whole GiB needed to hold bytes, at least one.
    static int64_t bytesToGib(uint64_t bytes);

private:
    // Waits on the operation a mutating call returned.
    Status complete(const Result<nlohmann::json>& operation, const std::string& what);

    GcpConfig config_;
    std::unique_ptr<ComputeApi> api_;
    OperationPoller operations_;
};
