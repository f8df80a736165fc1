#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "common/result.hpp"
#include "common/vm_types.hpp"

struct DiskAttachment {
    std::string location;
    std::string target;
    std::string serial;
};

/**
 * HypervisorBackend - one hypervisor the controller can drive.
 *
 * Implementations issue a single backend call per method and report the
 * outcome; readiness waits, escalation and confirmation live in the managers.
 * KvmBackend talks to a local libvirt host through virsh and qemu-img,
 * GcpBackend to the Compute Engine REST API.
 */
class HypervisorBackend {
public:
    virtual ~HypervisorBackend() = default;

    virtual std::string name() const = 0;

    // Inventory
    virtual Result<InstanceInventory> listInstances() = 0;
    virtual Result<VmState> getState(const std::string& vmName) = 0;
    virtual Result<std::string> getIpAddress(const std::string& vmName) = 0;

    // Power
    virtual Status start(const std::string& vmName) = 0;
    virtual Status shutdown(const std::string& vmName) = 0;
    virtual Status forceStop(const std::string& vmName) = 0;
    virtual Status reset(const std::string& vmName) = 0;
    virtual Status reboot(const std::string& vmName) = 0;

    // Removal
    virtual Status undefine(const std::string& vmName) = 0;
    virtual Status removeInstanceFiles(const std::string& vmName) = 0;

    // Disks
    virtual Result<std::vector<DiskResource>> listDisks(const std::string& vmName) = 0;
    // Every occupied target slot, including drives with no medium loaded.
    virtual Result<std::vector<std::string>> listTargets(const std::string& vmName) = 0;
    /**
     * Create an empty backing store of exactly sizeBytes.
     * @return location to pass to attachDisk
     */
    virtual Result<std::string> createDiskImage(const std::string& vmName, const std::string& diskName,
                                                uint64_t sizeBytes) = 0;
    virtual Status attachDisk(const std::string& vmName, const DiskAttachment& disk, bool live) = 0;
    virtual Status detachDisk(const std::string& vmName, const DiskResource& disk, bool live) = 0;
    virtual Status deleteDiskImage(const std::string& location) = 0;
    virtual Status resizeDiskImage(const std::string& location, uint64_t deltaBytes) = 0;
    virtual Status ejectMedia(const std::string& vmName, const std::string& target) = 0;
    virtual Status removeMediaDevice(const std::string& vmName, const std::string& target, bool live) = 0;

    // Network interfaces; running selects guest reported data over the static definition.
    virtual Result<std::vector<NetworkInterface>> listInterfaces(const std::string& vmName, bool running) = 0;
    virtual Status attachInterface(const std::string& vmName, const InterfaceSpec& spec, bool live) = 0;
    virtual Status detachInterface(const std::string& vmName, const std::string& mac, bool live) = 0;
};
