#pragma once

#include <chrono>
#include <string>
#include "backend/hypervisor_backend.hpp"
#include "common/confirmation.hpp"
#include "common/controller_config.hpp"
#include "common/poller.hpp"
#include "controller/state_tracker.hpp"
#include "provision/provisioning_handoff.hpp"

/**
 * LifecycleManager - power transitions and removal of a single VM.
 *
 * Every operation looks the VM up first and fails with NotFound, touching
 * nothing, when the backend does not know it. Operations that bring a VM up
 * only succeed once the guest reports a valid IPv4 address.
 */
class LifecycleManager {
public:
    // provisioner may be null; when set, deleteVm also drops the VM's client data.
    LifecycleManager(HypervisorBackend& backend,
                     const TimingConfig& timing,
                     Poller poller,
                     ConfirmationPolicy confirmation,
                     ProvisioningHandoff* provisioner = nullptr);

    Result<InstanceInventory> listInstances(bool sorted = true);

    Status start(const std::string& vmName);

    /**
     * Graceful shutdown, waiting up to maxWait for the VM to stop. If it is
     * still up afterwards the VM is destroyed once and given a short, final
     * wait to report stopped.
     */
    Status shutdown(const std::string& vmName, std::chrono::seconds maxWait);
    Status shutdown(const std::string& vmName);

    Status forceShutdown(const std::string& vmName);

    // A VM that is not running is started instead.
    Status reboot(const std::string& vmName);
    Status hardReset(const std::string& vmName);

    // shutdown followed by start
    Status softReset(const std::string& vmName);

    // Asks for confirmation unless force, stops a running VM, then removes
    // its definition and files. The first failing step ends the operation.
    Status deleteVm(const std::string& vmName, bool force);

    // Deletes every VM that is not running after a single confirmation.
    Status purge(bool force);

    Result<std::string> waitForIp(const std::string& vmName);

    StateTracker& tracker() { return tracker_; }

private:
    Status restart(const std::string& vmName, bool hard);
    Status waitForStopped(const std::string& vmName, std::chrono::seconds maxWait);

    HypervisorBackend& backend_;
    StateTracker tracker_;
    TimingConfig timing_;
    Poller poller_;
    ConfirmationPolicy confirmation_;
    ProvisioningHandoff* provisioner_;
};
