#include "backend/kvm/domain_inventory.hpp"
#include "backend/kvm/virsh_output.hpp"
#include "common/logger.hpp"
#include <cstdlib>
#include <libvirt/virterror.h>

VirshInventory::VirshInventory(CommandRunner& runner, std::string virshPath)
    : runner_(runner), virshPath_(std::move(virshPath)) {
}

Result<InstanceInventory> VirshInventory::listInstances() {
    std::vector<std::string> args = {"list", "--all"};
    ExecResult result = runner_.run(virshPath_, args);
    if (!result.succeeded()) {
        Logger::error("Command: " + formatCommand(virshPath_, args) + "\nExit Code: " +
                      std::to_string(result.exitCode) + "\nError: " + result.stderrOutput);
        return makeError(ErrorKind::TransportFailure, "Failed to list domains: " + result.stderrOutput);
    }
    return VirshOutput::parseDomainList(result.stdoutOutput);
}

Result<VmState> VirshInventory::getState(const std::string& vmName) {
    ExecResult result = runner_.run(virshPath_, {"dominfo", vmName});
    if (!result.succeeded()) {
        // virsh reports unknown domains on stderr with a non-zero exit
        if (result.stderrOutput.find("ailed to get domain") != std::string::npos ||
            result.stderrOutput.find("Domain not found") != std::string::npos) {
            return makeError(ErrorKind::NotFound, "VM " + vmName + " does not exist");
        }
        return makeError(ErrorKind::TransportFailure, "dominfo " + vmName + " failed: " + result.stderrOutput);
    }
    return VirshOutput::parseDomainState(result.stdoutOutput);
}

LibvirtInventory::LibvirtInventory(std::string uri) : uri_(std::move(uri)) {
}

LibvirtInventory::~LibvirtInventory() {
    disconnect();
}

void LibvirtInventory::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (conn_) {
        virConnectClose(conn_);
        conn_ = nullptr;
    }
}

Status LibvirtInventory::ensureConnected() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (conn_) {
        return Status::ok();
    }
    conn_ = virConnectOpenReadOnly(uri_.c_str());
    if (!conn_) {
        std::string message = "Failed to connect to " + uri_ + ": " + lastLibvirtError();
        Logger::error(message);
        return makeError(ErrorKind::TransportFailure, message);
    }
    Logger::debug("Opened read-only libvirt connection to " + uri_);
    return Status::ok();
}

Result<InstanceInventory> LibvirtInventory::listInstances() {
    Status connected = ensureConnected();
    if (connected.isErr()) {
        return connected.error();
    }

    virDomainPtr* domains = nullptr;
    int count = virConnectListAllDomains(conn_, &domains, 0);
    if (count < 0) {
        return makeError(ErrorKind::TransportFailure, "Failed to list domains: " + lastLibvirtError());
    }

    InstanceInventory inventory;
    for (int i = 0; i < count; ++i) {
        int state = VIR_DOMAIN_NOSTATE;
        const char* name = virDomainGetName(domains[i]);
        if (name && virDomainGetState(domains[i], &state, nullptr, 0) == 0) {
            switch (mapLibvirtState(state)) {
                case VmState::Running: inventory.running.emplace_back(name); break;
                case VmState::Stopped: inventory.stopped.emplace_back(name); break;
                case VmState::Paused:  inventory.paused.emplace_back(name); break;
                case VmState::Undefined: break;
            }
        }
        virDomainFree(domains[i]);
    }
    free(domains);
    return inventory;
}

Result<VmState> LibvirtInventory::getState(const std::string& vmName) {
    Status connected = ensureConnected();
    if (connected.isErr()) {
        return connected.error();
    }

    virDomainPtr domain = virDomainLookupByName(conn_, vmName.c_str());
    if (!domain) {
        return makeError(ErrorKind::NotFound, "VM " + vmName + " does not exist");
    }

    int state = VIR_DOMAIN_NOSTATE;
    int rc = virDomainGetState(domain, &state, nullptr, 0);
    virDomainFree(domain);
    if (rc < 0) {
        return makeError(ErrorKind::TransportFailure, "Failed to read state of " + vmName + ": " + lastLibvirtError());
    }
    return mapLibvirtState(state);
}

VmState LibvirtInventory::mapLibvirtState(int state) {
    switch (state) {
        case VIR_DOMAIN_RUNNING: return VmState::Running;
        case VIR_DOMAIN_PAUSED:  return VmState::Paused;
        case VIR_DOMAIN_SHUTOFF: return VmState::Stopped;
        default:                 return VmState::Undefined;
    }
}

std::string LibvirtInventory::lastLibvirtError() {
    const char* message = virGetLastErrorMessage();
    return message ? message : "unknown libvirt error";
}
