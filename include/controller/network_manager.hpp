#pragma once

#include <string>
#include <vector>
#include "backend/hypervisor_backend.hpp"
#include "common/controller_config.hpp"
#include "common/poller.hpp"
#include "controller/state_tracker.hpp"

// Network interfaces of a VM. While it runs, interfaces are reported by the
// guest (name, mac, address); otherwise they come from the VM definition.
class NetworkManager {
public:
    NetworkManager(HypervisorBackend& backend, InterfaceSpec defaults, const TimingConfig& timing, Poller poller);

    Result<std::vector<NetworkInterface>> addInterface(const std::string& vmName);
    Result<std::vector<NetworkInterface>> removeInterface(const std::string& vmName, const std::string& mac);
    Result<std::vector<NetworkInterface>> listInterfaces(const std::string& vmName);

    // Guest interfaces named eth*, running VMs only.
    Result<std::vector<NetworkInterface>> listEthInterfaces(const std::string& vmName);
    Result<std::string> interfaceAddress(const std::string& vmName, const std::string& interfaceName);

private:
    Result<std::vector<NetworkInterface>> guestInterfaces(const std::string& vmName);

    HypervisorBackend& backend_;
    StateTracker tracker_;
    InterfaceSpec defaults_;
    TimingConfig timing_;
    Poller poller_;
};
