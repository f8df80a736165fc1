#include "controller/state_tracker.hpp"
#include "common/logger.hpp"

StateTracker::StateTracker(HypervisorBackend& backend) : backend_(backend) {
}

Result<InstanceInventory> StateTracker::listInstances() {
    auto inventory = backend_.listInstances();
    if (inventory.isErr()) {
        Logger::error("Failed to list VMs on " + backend_.name() + ": " + inventory.message());
    }
    return inventory;
}

Result<bool> StateTracker::exists(const std::string& vmName) {
    auto inventory = listInstances();
    if (inventory.isErr()) {
        return inventory.unwrapErr();
    }
    return inventory.unwrap().contains(vmName);
}

Result<VmState> StateTracker::requireExisting(const std::string& vmName) {
    auto inventory = listInstances();
    if (inventory.isErr()) {
        return inventory.unwrapErr();
    }
    VmState state = inventory.unwrap().stateOf(vmName);
    if (state == VmState::Undefined) {
        Logger::error("VM " + vmName + " does not exist");
        return makeError(ErrorKind::NotFound, "VM " + vmName + " does not exist");
    }
    return state;
}
