#pragma once

#include <mutex>
#include <string>
#include <libvirt/libvirt.h>
#include "common/command_runner.hpp"
#include "common/result.hpp"
#include "common/vm_types.hpp"

// Where the local backend learns which domains exist and their power state.
class DomainInventory {
public:
    virtual ~DomainInventory() = default;

    virtual Result<InstanceInventory> listInstances() = 0;
    // NotFound when no domain carries the name.
    virtual Result<VmState> getState(const std::string& vmName) = 0;
};

class VirshInventory : public DomainInventory {
public:
    VirshInventory(CommandRunner& runner, std::string virshPath);

    Result<InstanceInventory> listInstances() override;
    Result<VmState> getState(const std::string& vmName) override;

private:
    CommandRunner& runner_;
    std::string virshPath_;
};

// Read-only libvirt connection, opened lazily on first use.
class LibvirtInventory : public DomainInventory {
public:
    explicit LibvirtInventory(std::string uri);
    ~LibvirtInventory() override;

    LibvirtInventory(const LibvirtInventory&) = delete;
    LibvirtInventory& operator=(const LibvirtInventory&) = delete;

    Result<InstanceInventory> listInstances() override;
    Result<VmState> getState(const std::string& vmName) override;

    void disconnect();

private:
    Status ensureConnected();
    static VmState mapLibvirtState(int state);
    static std::string lastLibvirtError();

    std::string uri_;
    virConnectPtr conn_ = nullptr;
    std::mutex mutex_;
};
