#pragma once

#include <string>
#include <vector>
#include "backend/hypervisor_backend.hpp"
#include "common/confirmation.hpp"
#include "controller/lifecycle_manager.hpp"
#include "controller/state_tracker.hpp"
#include "provision/provisioning_handoff.hpp"

/**
 * DiskManager - data disks of a VM.
 *
 * Disks are addressed by target slot. "sda" is the boot disk: it can only be
 * grown, never removed, mounted or unmounted. New disks take the slot one
 * letter past the greatest one in use. Work inside the guest (partitioning,
 * filesystems, mounts) is delegated to the provisioning handoff, which finds
 * the disk by its serial under /dev/disk/by-id.
 */
class DiskManager {
public:
    static constexpr const char* kFormatPlaybook = "format_disk.yml";
    static constexpr const char* kMountPlaybook = "mount_disk.yml";
    static constexpr const char* kUnmountPlaybook = "unmount_disk.yml";
    static constexpr const char* kResizePlaybook = "resize_disk.yml";
    static constexpr const char* kDefaultFilesystem = "ext4";

    DiskManager(HypervisorBackend& backend,
                LifecycleManager& lifecycle,
                ProvisioningHandoff& provisioner,
                ConfirmationPolicy confirmation);

    Result<std::vector<DiskResource>> listDisks(const std::string& vmName);

    /**
     * Create and attach an empty disk of size (e.g. "10G").
     * On a running VM the disk is attached live, partitioned, formatted and
     * mounted at mountPoint (/mnt/<disk name> when empty).
     * @param diskName generated as data-<hex> when empty
     */
    Result<DiskResource> createDataDisk(const std::string& vmName, const std::string& size,
                                        const std::string& diskName = "", const std::string& mountPoint = "");

    // Attach a backing store that already exists; nothing is done inside the guest.
    Result<DiskResource> attachExistingDisk(const std::string& vmName, const std::string& location);

    // Unmounts (running VM), detaches, then deletes the backing store if confirmed.
    Status removeDataDisk(const std::string& vmName, const std::string& target, bool force);

    // Grows target by size ("+5G" or "5G"). The VM is shut down for the resize,
    // which needs confirmation unless force, then started again and the guest
    // partition and filesystem are grown.
    Status increaseDiskSize(const std::string& vmName, const std::string& target,
                            const std::string& size, bool force);

    Status mountDisk(const std::string& vmName, const std::string& target, const std::string& mountPoint);
    Status unmountDisk(const std::string& vmName, const std::string& target);

    // Ejects the first installation image; removeCdrom also drops the drive.
    Status ejectInstallMedia(const std::string& vmName, bool removeCdrom = true);

    // "sda" for a VM without disks, otherwise one letter past the greatest target.
    static Result<std::string> nextTarget(const std::vector<std::string>& targets);
    static std::string serialFor(const std::string& vmName, const std::string& location);
    // Serial of the first partition for data disks; the bare serial for the boot disk.
    static std::string deviceNameFor(const DiskResource& disk);

private:
    Result<DiskResource> findDisk(const std::string& vmName, const std::string& target);
    Result<std::string> allocateTarget(const std::string& vmName);
    Result<DiskResource> attach(const std::string& vmName, const std::string& location,
                                uint64_t sizeBytes, bool running);
    Status runInGuest(const std::string& vmName, const std::string& playbook, const ExtraVars& vars);

    HypervisorBackend& backend_;
    LifecycleManager& lifecycle_;
    ProvisioningHandoff& provisioner_;
    ConfirmationPolicy confirmation_;
    StateTracker tracker_;
};
