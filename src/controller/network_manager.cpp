#include "controller/network_manager.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <cctype>

namespace {

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

}  // namespace

NetworkManager::NetworkManager(HypervisorBackend& backend, InterfaceSpec defaults,
                               const TimingConfig& timing, Poller poller)
    : backend_(backend),
      tracker_(backend),
      defaults_(std::move(defaults)),
      timing_(timing),
      poller_(std::move(poller)) {
}

Result<std::vector<NetworkInterface>> NetworkManager::listInterfaces(const std::string& vmName) {
    auto state = tracker_.requireExisting(vmName);
    if (state.isErr()) {
        return state.unwrapErr();
    }
    auto interfaces = backend_.listInterfaces(vmName, state.unwrap() == VmState::Running);
    if (interfaces.isErr()) {
        Logger::error("Failed to list interfaces of " + vmName + ": " + interfaces.message());
    }
    return interfaces;
}

Result<std::vector<NetworkInterface>> NetworkManager::addInterface(const std::string& vmName) {
    auto state = tracker_.requireExisting(vmName);
    if (state.isErr()) {
        return state.unwrapErr();
    }
    const bool running = state.unwrap() == VmState::Running;

    Status attached = backend_.attachInterface(vmName, defaults_, running);
    if (attached.isErr()) {
        Logger::error("Failed to add an interface on " + defaults_.bridge + " to " + vmName + ": " +
                      attached.message());
        return attached.error();
    }
    Logger::success("Added a " + defaults_.model + " interface on " + defaults_.bridge + " to " + vmName);

    if (running) {
        // give the guest time to bring the link up and lease an address
        poller_.sleep(std::chrono::seconds(timing_.interfaceSettleSec));
    }
    return backend_.listInterfaces(vmName, running);
}

Result<std::vector<NetworkInterface>> NetworkManager::removeInterface(const std::string& vmName,
                                                                       const std::string& mac) {
    auto state = tracker_.requireExisting(vmName);
    if (state.isErr()) {
        return state.unwrapErr();
    }
    const bool running = state.unwrap() == VmState::Running;

    auto current = backend_.listInterfaces(vmName, running);
    if (current.isErr()) {
        return current;
    }
    const std::string wanted = lower(mac);
    bool known = std::any_of(current.unwrap().begin(), current.unwrap().end(),
                             [&wanted](const NetworkInterface& nic) { return lower(nic.mac) == wanted; });
    if (!known) {
        Logger::error(vmName + " has no interface with MAC " + mac);
        return makeError(ErrorKind::NotFound, vmName + " has no interface with MAC " + mac);
    }

    Status detached = backend_.detachInterface(vmName, mac, running);
    if (detached.isErr()) {
        Logger::error("Failed to remove interface " + mac + " from " + vmName + ": " + detached.message());
        return detached.error();
    }
    Logger::success("Removed interface " + mac + " from " + vmName);
    return backend_.listInterfaces(vmName, running);
}

Result<std::vector<NetworkInterface>> NetworkManager::guestInterfaces(const std::string& vmName) {
    auto state = tracker_.requireExisting(vmName);
    if (state.isErr()) {
        return state.unwrapErr();
    }
    if (state.unwrap() != VmState::Running) {
        return makeError(ErrorKind::StateConflict, vmName + " must be running to report guest interfaces");
    }
    return backend_.listInterfaces(vmName, true);
}

Result<std::vector<NetworkInterface>> NetworkManager::listEthInterfaces(const std::string& vmName) {
    auto interfaces = guestInterfaces(vmName);
    if (interfaces.isErr()) {
        return interfaces;
    }
    std::vector<NetworkInterface> eth;
    for (const auto& nic : interfaces.unwrap()) {
        if (utils::startsWith(nic.name, "eth")) {
            eth.push_back(nic);
        }
    }
    return eth;
}

Result<std::string> NetworkManager::interfaceAddress(const std::string& vmName, const std::string& interfaceName) {
    auto interfaces = guestInterfaces(vmName);
    if (interfaces.isErr()) {
        return interfaces.unwrapErr();
    }
    for (const auto& nic : interfaces.unwrap()) {
        if (nic.name == interfaceName && !nic.ip.empty()) {
            return nic.ip;
        }
    }
    return makeError(ErrorKind::NotFound, interfaceName + " on " + vmName + " has no address");
}
