#include "controller/disk_manager.hpp"
#include "common/logger.hpp"
#include "common/size_units.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <cctype>

namespace {

const char* const kBootTarget = "sda";

Status refuseBootDisk(const std::string& action) {
    Logger::error("Refusing to " + action + " the boot disk " + kBootTarget);
    return makeError(ErrorKind::StateConflict, std::string("Cannot ") + action + " the boot disk " + kBootTarget);
}

}  // namespace

DiskManager::DiskManager(HypervisorBackend& backend,
                         LifecycleManager& lifecycle,
                         ProvisioningHandoff& provisioner,
                         ConfirmationPolicy confirmation)
    : backend_(backend),
      lifecycle_(lifecycle),
      provisioner_(provisioner),
      confirmation_(std::move(confirmation)),
      tracker_(backend) {
}

Result<std::string> DiskManager::nextTarget(const std::vector<std::string>& targets) {
    if (targets.empty()) {
        return std::string(kBootTarget);
    }
    std::string target = *std::max_element(targets.begin(), targets.end());
    if (target.empty() || !std::islower(static_cast<unsigned char>(target.back()))) {
        return makeError(ErrorKind::ParseError, "Cannot allocate a target after '" + target + "'");
    }
    if (target.back() == 'z') {
        return makeError(ErrorKind::StateConflict, "No target left after " + target);
    }
    target.back() = static_cast<char>(target.back() + 1);
    return target;
}

std::string DiskManager::serialFor(const std::string& vmName, const std::string& location) {
    return vmName + "-" + utils::stem(location);
}

std::string DiskManager::deviceNameFor(const DiskResource& disk) {
    // single partition layout assumed for data disks
    return disk.isBootDisk() ? disk.serial : disk.serial + "-part1";
}

Result<std::vector<DiskResource>> DiskManager::listDisks(const std::string& vmName) {
    auto state = tracker_.requireExisting(vmName);
    if (state.isErr()) {
        return state.unwrapErr();
    }
    auto disks = backend_.listDisks(vmName);
    if (disks.isErr()) {
        Logger::error("Failed to list disks of " + vmName + ": " + disks.message());
        return disks;
    }
    for (const auto& disk : disks.unwrap()) {
        Logger::debug(vmName + " " + disk.target + " " + disk.location + " " + SizeUnits::toHuman(disk.sizeBytes));
    }
    return disks;
}

Result<DiskResource> DiskManager::findDisk(const std::string& vmName, const std::string& target) {
    auto disks = backend_.listDisks(vmName);
    if (disks.isErr()) {
        return disks.unwrapErr();
    }
    for (const auto& disk : disks.unwrap()) {
        if (disk.target == target) {
            return disk;
        }
    }
    Logger::error(vmName + " has no disk at " + target);
    return makeError(ErrorKind::NotFound, vmName + " has no disk at " + target);
}

// Empty drives hold a slot too, so allocation reads targets rather than disks.
Result<std::string> DiskManager::allocateTarget(const std::string& vmName) {
    auto targets = backend_.listTargets(vmName);
    if (targets.isErr()) {
        return targets.unwrapErr();
    }
    auto target = nextTarget(targets.unwrap());
    if (target.isErr()) {
        Logger::error("Cannot attach another disk to " + vmName + ": " + target.message());
    }
    return target;
}

Status DiskManager::runInGuest(const std::string& vmName, const std::string& playbook, const ExtraVars& vars) {
    auto ip = lifecycle_.waitForIp(vmName);
    if (ip.isErr()) {
        return ip.status();
    }
    return provisioner_.run(ip.unwrap(), vmName, playbook, vars);
}

Result<DiskResource> DiskManager::attach(const std::string& vmName, const std::string& location,
                                         uint64_t sizeBytes, bool running) {
    auto target = allocateTarget(vmName);
    if (target.isErr()) {
        return target.unwrapErr();
    }

    DiskResource disk;
    disk.target = target.unwrap();
    disk.location = location;
    disk.serial = serialFor(vmName, location);
    disk.sizeBytes = sizeBytes;

    Status attached = backend_.attachDisk(vmName, {disk.location, disk.target, disk.serial}, running);
    if (attached.isErr()) {
        Logger::error("Failed to attach " + location + " to " + vmName + ": " + attached.message());
        return attached.error();
    }
    Logger::success("Attached " + location + " to " + vmName + " as " + disk.target);
    return disk;
}

Result<DiskResource> DiskManager::createDataDisk(const std::string& vmName, const std::string& size,
                                                 const std::string& diskName, const std::string& mountPoint) {
    auto state = tracker_.requireExisting(vmName);
    if (state.isErr()) {
        return state.unwrapErr();
    }
    auto bytes = SizeUnits::toBytes(size);
    if (bytes.isErr()) {
        Logger::error("Invalid disk size " + size + ": " + bytes.message());
        return bytes.unwrapErr();
    }
    if (bytes.unwrap() == 0) {
        return makeError(ErrorKind::ParseError, "Disk size must be greater than zero");
    }

    // fail on a full slot table before leaving an image behind
    auto target = allocateTarget(vmName);
    if (target.isErr()) {
        return target.unwrapErr();
    }

    std::string name = diskName.empty() ? "data-" + utils::randomHex(8) : diskName;
    Logger::info("Creating " + SizeUnits::toHuman(bytes.unwrap()) + " disk " + name + " for " + vmName);
    auto location = backend_.createDiskImage(vmName, name, bytes.unwrap());
    if (location.isErr()) {
        Logger::error("Failed to create disk " + name + ": " + location.message());
        return location.unwrapErr();
    }

    const bool running = state.unwrap() == VmState::Running;
    auto disk = attach(vmName, location.unwrap(), bytes.unwrap(), running);
    if (disk.isErr() || !running) {
        return disk;
    }

    ExtraVars vars = {
        {"device_name", disk.unwrap().serial},
        {"filesystem", kDefaultFilesystem},
        {"mount", mountPoint.empty() ? "/mnt/" + name : mountPoint},
    };
    Status formatted = runInGuest(vmName, kFormatPlaybook, vars);
    if (formatted.isErr()) {
        Logger::error("Disk " + name + " is attached but could not be formatted: " + formatted.message());
        return formatted.error();
    }
    return disk;
}

Result<DiskResource> DiskManager::attachExistingDisk(const std::string& vmName, const std::string& location) {
    auto state = tracker_.requireExisting(vmName);
    if (state.isErr()) {
        return state.unwrapErr();
    }
    return attach(vmName, location, 0, state.unwrap() == VmState::Running);
}

Status DiskManager::removeDataDisk(const std::string& vmName, const std::string& target, bool force) {
    auto state = tracker_.requireExisting(vmName);
    if (state.isErr()) {
        return state.status();
    }
    if (target == kBootTarget) {
        return refuseBootDisk("remove");
    }
    auto disk = findDisk(vmName, target);
    if (disk.isErr()) {
        return disk.status();
    }
    if (disk.unwrap().isInstallMedia()) {
        return makeError(ErrorKind::StateConflict, target + " holds installation media, eject it instead");
    }

    const bool running = state.unwrap() == VmState::Running;
    if (running) {
        Status unmounted = runInGuest(vmName, kUnmountPlaybook, {{"device_name", deviceNameFor(disk.unwrap())}});
        if (unmounted.isErr()) {
            Logger::error("Failed to unmount " + target + " on " + vmName + ": " + unmounted.message());
            return unmounted;
        }
    }

    Status detached = backend_.detachDisk(vmName, disk.unwrap(), running);
    if (detached.isErr()) {
        Logger::error("Failed to detach " + target + " from " + vmName + ": " + detached.message());
        return detached;
    }
    Logger::success("Detached " + target + " from " + vmName);

    const std::string& location = disk.unwrap().location;
    if (!confirmation_.confirm("Delete " + location + "?", force)) {
        Logger::info("Keeping " + location);
        return Status::ok();
    }
    Status deleted = backend_.deleteDiskImage(location);
    if (deleted.isErr()) {
        Logger::error("Failed to delete " + location + ": " + deleted.message());
        return deleted;
    }
    Logger::success("Deleted " + location);
    return Status::ok();
}

Status DiskManager::increaseDiskSize(const std::string& vmName, const std::string& target,
                                     const std::string& size, bool force) {
    auto state = tracker_.requireExisting(vmName);
    if (state.isErr()) {
        return state.status();
    }
    auto delta = SizeUnits::toDeltaBytes(size);
    if (delta.isErr()) {
        Logger::error("Invalid size increase " + size + ": " + delta.message());
        return delta.status();
    }
    if (delta.unwrap() == 0) {
        return makeError(ErrorKind::ParseError, "Size increase must be greater than zero");
    }
    auto disk = findDisk(vmName, target);
    if (disk.isErr()) {
        return disk.status();
    }
    if (disk.unwrap().isInstallMedia()) {
        return makeError(ErrorKind::StateConflict, target + " holds installation media");
    }

    if (state.unwrap() != VmState::Stopped) {
        if (!confirmation_.confirm(vmName + " must be shut down to resize " + target + ". Shut it down now?",
                                   force)) {
            Logger::warning("Not resizing " + target + " while " + vmName + " is " + vmStateName(state.unwrap()));
            return makeError(ErrorKind::StateConflict, vmName + " must be shut down to resize " + target);
        }
        Status stopped = state.unwrap() == VmState::Running ? lifecycle_.shutdown(vmName)
                                                            : lifecycle_.forceShutdown(vmName);
        if (stopped.isErr()) {
            return stopped;
        }
    }

    Logger::info("Growing " + target + " of " + vmName + " by " + SizeUnits::toHuman(delta.unwrap()));
    Status resized = backend_.resizeDiskImage(disk.unwrap().location, delta.unwrap());
    if (resized.isErr()) {
        Logger::error("Failed to resize " + disk.unwrap().location + ": " + resized.message());
        return resized;
    }

    Status started = lifecycle_.start(vmName);
    if (started.isErr()) {
        return started;
    }

    Status grown = runInGuest(vmName, kResizePlaybook, {{"device_name", deviceNameFor(disk.unwrap())}});
    if (grown.isErr()) {
        Logger::error("Disk " + target + " was resized but the filesystem was not grown: " + grown.message());
        return grown;
    }
    Logger::success("Resized " + target + " of " + vmName);
    return Status::ok();
}

Status DiskManager::mountDisk(const std::string& vmName, const std::string& target, const std::string& mountPoint) {
    auto state = tracker_.requireExisting(vmName);
    if (state.isErr()) {
        return state.status();
    }
    if (target == kBootTarget) {
        return refuseBootDisk("mount");
    }
    if (state.unwrap() != VmState::Running) {
        return makeError(ErrorKind::StateConflict, vmName + " must be running to mount " + target);
    }
    auto disk = findDisk(vmName, target);
    if (disk.isErr()) {
        return disk.status();
    }
    return runInGuest(vmName, kMountPlaybook,
                      {{"device_name", deviceNameFor(disk.unwrap())}, {"mount", mountPoint}});
}

Status DiskManager::unmountDisk(const std::string& vmName, const std::string& target) {
    auto state = tracker_.requireExisting(vmName);
    if (state.isErr()) {
        return state.status();
    }
    if (target == kBootTarget) {
        return refuseBootDisk("unmount");
    }
    if (state.unwrap() != VmState::Running) {
        return makeError(ErrorKind::StateConflict, vmName + " must be running to unmount " + target);
    }
    auto disk = findDisk(vmName, target);
    if (disk.isErr()) {
        return disk.status();
    }
    return runInGuest(vmName, kUnmountPlaybook, {{"device_name", deviceNameFor(disk.unwrap())}});
}

Status DiskManager::ejectInstallMedia(const std::string& vmName, bool removeCdrom) {
    auto state = tracker_.requireExisting(vmName);
    if (state.isErr()) {
        return state.status();
    }
    auto disks = backend_.listDisks(vmName);
    if (disks.isErr()) {
        return disks.status();
    }
    auto media = std::find_if(disks.unwrap().begin(), disks.unwrap().end(),
                              [](const DiskResource& disk) { return disk.isInstallMedia(); });
    if (media == disks.unwrap().end()) {
        Logger::info(vmName + " has no installation media");
        return makeError(ErrorKind::NotFound, vmName + " has no installation media");
    }

    Status ejected = backend_.ejectMedia(vmName, media->target);
    if (ejected.isErr()) {
        return ejected;
    }
    if (removeCdrom) {
        Status removed = backend_.removeMediaDevice(vmName, media->target, state.unwrap() == VmState::Running);
        if (removed.isErr()) {
            return removed;
        }
    }
    Logger::success("Ejected " + media->location + " from " + vmName);
    return Status::ok();
}
