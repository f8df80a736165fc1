#pragma once

#include <string>
#include "backend/hypervisor_backend.hpp"
#include "common/result.hpp"
#include "common/vm_types.hpp"

// Current power state of the VMs a backend knows about.
class StateTracker {
public:
    explicit StateTracker(HypervisorBackend& backend);

    Result<InstanceInventory> listInstances();
    Result<bool> exists(const std::string& vmName);

    // State of vmName, NotFound when the backend does not list it.
    Result<VmState> requireExisting(const std::string& vmName);

private:
    HypervisorBackend& backend_;
};
