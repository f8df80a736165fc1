#include "controller/lifecycle_manager.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>

LifecycleManager::LifecycleManager(HypervisorBackend& backend,
                                   const TimingConfig& timing,
                                   Poller poller,
                                   ConfirmationPolicy confirmation,
                                   ProvisioningHandoff* provisioner)
    : backend_(backend),
      tracker_(backend),
      timing_(timing),
      poller_(std::move(poller)),
      confirmation_(std::move(confirmation)),
      provisioner_(provisioner) {
}

Result<InstanceInventory> LifecycleManager::listInstances(bool sorted) {
    auto inventory = tracker_.listInstances();
    if (inventory.isErr() || !sorted) {
        return inventory;
    }
    InstanceInventory ordered = inventory.unwrap();
    ordered.sort();
    return ordered;
}

Result<std::string> LifecycleManager::waitForIp(const std::string& vmName) {
    const int interval = std::max(1, timing_.startPollIntervalSec);
    const int attempts = std::max(1, timing_.startWaitSec / interval);

    std::string address;
    Status ready = poller_.waitUntil(
        [&]() {
            auto ip = backend_.getIpAddress(vmName);
            if (ip.isErr() || !utils::isValidIPv4(ip.unwrap())) {
                return false;
            }
            address = ip.unwrap();
            return true;
        },
        std::chrono::seconds(interval), attempts, "an IP address on " + vmName);
    if (ready.isErr()) {
        Logger::error(vmName + " did not report an IP address within " + std::to_string(timing_.startWaitSec) +
                      " seconds");
        return ready.error();
    }
    Logger::info(vmName + " is reachable at " + address);
    return address;
}

Status LifecycleManager::start(const std::string& vmName) {
    auto state = tracker_.requireExisting(vmName);
    if (state.isErr()) {
        return state.status();
    }
    if (state.unwrap() == VmState::Running) {
        Logger::info(vmName + " is already running");
        return Status::ok();
    }

    Logger::info("Starting " + vmName);
    Status started = backend_.start(vmName);
    if (started.isErr()) {
        Logger::error("Failed to start " + vmName + ": " + started.message());
        return started;
    }

    // the VM stays up even if no address appears
    auto ip = waitForIp(vmName);
    if (ip.isErr()) {
        return ip.status();
    }
    Logger::success("Started " + vmName);
    return Status::ok();
}

Status LifecycleManager::waitForStopped(const std::string& vmName, std::chrono::seconds maxWait) {
    const int interval = std::max(1, timing_.shutdownPollIntervalSec);
    const int attempts = std::max(1, static_cast<int>(maxWait.count()) / interval);
    return poller_.waitUntil(
        [&]() {
            auto state = backend_.getState(vmName);
            return state.isOk() && state.unwrap() == VmState::Stopped;
        },
        std::chrono::seconds(interval), attempts, vmName + " to stop");
}

Status LifecycleManager::shutdown(const std::string& vmName) {
    return shutdown(vmName, std::chrono::seconds(timing_.shutdownWaitSec));
}

Status LifecycleManager::shutdown(const std::string& vmName, std::chrono::seconds maxWait) {
    auto state = tracker_.requireExisting(vmName);
    if (state.isErr()) {
        return state.status();
    }
    if (state.unwrap() != VmState::Running) {
        Logger::info(vmName + " is not running");
        return Status::ok();
    }

    Logger::info("Shutting down " + vmName);
    Status requested = backend_.shutdown(vmName);
    if (requested.isErr()) {
        Logger::error("Failed to shut down " + vmName + ": " + requested.message());
        return requested;
    }

    Status stopped = waitForStopped(vmName, maxWait);
    if (stopped.isOk()) {
        Logger::success(vmName + " is shut down");
        return stopped;
    }
    if (stopped.kind() != ErrorKind::TimeoutExceeded) {
        return stopped;
    }

    Logger::warning(vmName + " did not shut down within " + std::to_string(maxWait.count()) +
                    " seconds, forcing it off");
    return forceShutdown(vmName);
}

Status LifecycleManager::forceShutdown(const std::string& vmName) {
    auto state = tracker_.requireExisting(vmName);
    if (state.isErr()) {
        return state.status();
    }
    if (state.unwrap() == VmState::Stopped) {
        Logger::info(vmName + " is not running");
        return Status::ok();
    }

    Status destroyed = backend_.forceStop(vmName);
    if (destroyed.isErr()) {
        Logger::error("Failed to force off " + vmName + ": " + destroyed.message());
        return destroyed;
    }

    Status stopped = waitForStopped(vmName, std::chrono::seconds(timing_.forcedShutdownWaitSec));
    if (stopped.isErr()) {
        Logger::error(vmName + " is still not stopped after being forced off");
        return stopped;
    }
    Logger::success(vmName + " is shut down");
    return Status::ok();
}

Status LifecycleManager::restart(const std::string& vmName, bool hard) {
    auto state = tracker_.requireExisting(vmName);
    if (state.isErr()) {
        return state.status();
    }
    if (state.unwrap() != VmState::Running) {
        Logger::info(vmName + " is not running, starting it");
        return start(vmName);
    }

    Logger::info((hard ? "Resetting " : "Rebooting ") + vmName);
    Status issued = hard ? backend_.reset(vmName) : backend_.reboot(vmName);
    if (issued.isErr()) {
        Logger::error(std::string(hard ? "Failed to reset " : "Failed to reboot ") + vmName + ": " +
                      issued.message());
        return issued;
    }

    auto ip = waitForIp(vmName);
    if (ip.isErr()) {
        return ip.status();
    }
    Logger::success((hard ? "Reset " : "Rebooted ") + vmName);
    return Status::ok();
}

Status LifecycleManager::reboot(const std::string& vmName) {
    return restart(vmName, false);
}

Status LifecycleManager::hardReset(const std::string& vmName) {
    return restart(vmName, true);
}

Status LifecycleManager::softReset(const std::string& vmName) {
    Status stopped = shutdown(vmName);
    if (stopped.isErr()) {
        return stopped;
    }
    return start(vmName);
}

Status LifecycleManager::deleteVm(const std::string& vmName, bool force) {
    auto state = tracker_.requireExisting(vmName);
    if (state.isErr()) {
        return state.status();
    }
    if (!confirmation_.confirm("Delete VM " + vmName + " and all of its disks?", force)) {
        Logger::warning("Not deleting " + vmName);
        return makeError(ErrorKind::StateConflict, "Deletion of " + vmName + " was not confirmed");
    }

    if (state.unwrap() != VmState::Stopped) {
        // a paused guest still holds its images open and cannot shut down on its own
        Status stopped = state.unwrap() == VmState::Running ? shutdown(vmName) : forceShutdown(vmName);
        if (stopped.isErr()) {
            Logger::error("Not deleting " + vmName + ", it could not be shut down");
            return stopped;
        }
    }

    Status undefined = backend_.undefine(vmName);
    if (undefined.isErr()) {
        Logger::error("Failed to remove the definition of " + vmName + ": " + undefined.message());
        return undefined;
    }
    auto remaining = tracker_.exists(vmName);
    if (remaining.isErr()) {
        return remaining.status();
    }
    if (remaining.unwrap()) {
        Logger::error(vmName + " is still defined, keeping its files");
        return makeError(ErrorKind::StateConflict, vmName + " is still defined after undefine");
    }

    Status removed = backend_.removeInstanceFiles(vmName);
    if (removed.isErr()) {
        return removed;
    }

    if (provisioner_) {
        Status forgotten = provisioner_->removeClient(vmName);
        if (forgotten.isErr()) {
            return forgotten;
        }
    }
    Logger::success("Deleted " + vmName);
    return Status::ok();
}

Status LifecycleManager::purge(bool force) {
    auto inventory = listInstances(true);
    if (inventory.isErr()) {
        return inventory.status();
    }

    std::vector<std::string> victims = inventory.unwrap().stopped;
    const auto& paused = inventory.unwrap().paused;
    victims.insert(victims.end(), paused.begin(), paused.end());
    if (victims.empty()) {
        Logger::info("No VMs to purge");
        return Status::ok();
    }

    std::string names;
    for (const auto& name : victims) {
        names += names.empty() ? name : ", " + name;
    }
    if (!confirmation_.confirm("Delete " + std::to_string(victims.size()) + " VMs that are not running (" +
                                   names + ")?",
                               force)) {
        Logger::warning("Purge cancelled");
        return makeError(ErrorKind::StateConflict, "Purge was not confirmed");
    }

    for (const auto& name : victims) {
        Status deleted = deleteVm(name, true);
        if (deleted.isErr()) {
            return deleted;
        }
    }
    Logger::success("Purged " + std::to_string(victims.size()) + " VMs");
    return Status::ok();
}
