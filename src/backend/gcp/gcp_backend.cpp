#include "backend/gcp/gcp_backend.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"

namespace {

constexpr uint64_t kGiB = 1024ULL * 1024ULL * 1024ULL;

Result<int64_t> parseSizeGb(const nlohmann::json& value) {
    try {
        if (value.is_number_integer()) {
            return value.get<int64_t>();
        }
        if (value.is_string()) {
            return static_cast<int64_t>(std::stoll(value.get<std::string>()));
        }
    } catch (const std::exception& e) {
        return makeError(ErrorKind::ParseError, std::string("Invalid disk size: ") + e.what());
    }
    return makeError(ErrorKind::ParseError, "Invalid disk size: " + value.dump());
}

Status notSupported(const std::string& what) {
    Logger::error(what + " is not supported on gcp");
    return makeError(ErrorKind::StateConflict, what + " is not supported on gcp");
}

}  // namespace

GcpBackend::GcpBackend(const GcpConfig& config, std::unique_ptr<ComputeApi> api, Poller poller)
    : config_(config),
      api_(std::move(api)),
      operations_(*api_, std::move(poller),
                  std::chrono::seconds(config.operationPollIntervalSec),
                  std::chrono::seconds(config.operationTimeoutSec)) {
}

VmState GcpBackend::stateFromStatus(const std::string& status) {
    if (status == "RUNNING") return VmState::Running;
    if (status == "TERMINATED" || status == "STOPPED" || status == "STOPPING") return VmState::Stopped;
    if (status == "SUSPENDED" || status == "SUSPENDING") return VmState::Paused;
    return VmState::Undefined;
}

int64_t GcpBackend::bytesToGib(uint64_t bytes) {
    int64_t gib = static_cast<int64_t>((bytes + kGiB - 1) / kGiB);
    return gib < 1 ? 1 : gib;
}

Status GcpBackend::complete(const Result<nlohmann::json>& operation, const std::string& what) {
    if (operation.isErr()) {
        Logger::error(what + " failed: " + operation.message());
        return operation.status();
    }
    Status done = operations_.waitForZoneOperation(operation.unwrap());
    if (done.isErr()) {
        Logger::error(what + " did not complete: " + done.message());
    }
    return done;
}

Result<InstanceInventory> GcpBackend::listInstances() {
    auto instances = api_->listInstances();
    if (instances.isErr()) {
        return instances.unwrapErr();
    }
    InstanceInventory inventory;
    for (const auto& instance : instances.unwrap()) {
        std::string name = instance.value("name", std::string());
        if (name.empty()) {
            continue;
        }
        switch (stateFromStatus(instance.value("status", std::string()))) {
            case VmState::Running: inventory.running.push_back(name); break;
            case VmState::Stopped: inventory.stopped.push_back(name); break;
            case VmState::Paused:  inventory.paused.push_back(name); break;
            case VmState::Undefined: break;
        }
    }
    return inventory;
}

Result<VmState> GcpBackend::getState(const std::string& vmName) {
    auto instance = api_->getInstance(vmName);
    if (instance.isErr()) {
        return instance.unwrapErr();
    }
    return stateFromStatus(instance.unwrap().value("status", std::string()));
}

Result<std::string> GcpBackend::getIpAddress(const std::string& vmName) {
    auto instance = api_->getInstance(vmName);
    if (instance.isErr()) {
        return instance.unwrapErr();
    }
    const auto& body = instance.unwrap();
    if (body.contains("networkInterfaces")) {
        for (const auto& nic : body["networkInterfaces"]) {
            if (!nic.contains("accessConfigs")) {
                continue;
            }
            for (const auto& access : nic["accessConfigs"]) {
                std::string ip = access.value("natIP", std::string());
                if (!ip.empty()) {
                    return ip;
                }
            }
        }
    }
    return makeError(ErrorKind::NotFound, "No external address on " + vmName);
}

Status GcpBackend::start(const std::string& vmName) {
    return complete(api_->startInstance(vmName), "start " + vmName);
}

Status GcpBackend::shutdown(const std::string& vmName) {
    return complete(api_->stopInstance(vmName), "stop " + vmName);
}

Status GcpBackend::forceStop(const std::string& vmName) {
    return complete(api_->stopInstance(vmName), "stop " + vmName);
}

Status GcpBackend::reset(const std::string& vmName) {
    return complete(api_->resetInstance(vmName), "reset " + vmName);
}

Status GcpBackend::reboot(const std::string& vmName) {
    return complete(api_->resetInstance(vmName), "reset " + vmName);
}

Status GcpBackend::undefine(const std::string& vmName) {
    return complete(api_->deleteInstance(vmName), "delete " + vmName);
}

Status GcpBackend::removeInstanceFiles(const std::string& vmName) {
    Logger::debug("No local files kept for gcp instance " + vmName);
    return Status::ok();
}

Result<std::vector<std::string>> GcpBackend::listTargets(const std::string& vmName) {
    auto instance = api_->getInstance(vmName);
    if (instance.isErr()) {
        return instance.unwrapErr();
    }
    std::vector<std::string> targets;
    for (const auto& attached : instance.unwrap().value("disks", nlohmann::json::array())) {
        int index = attached.value("index", 0);
        if (index < 0 || index >= 26) {
            return makeError(ErrorKind::ParseError, "Disk index out of range on " + vmName);
        }
        targets.push_back(std::string("sd") + static_cast<char>('a' + index));
    }
    return targets;
}

Result<std::vector<DiskResource>> GcpBackend::listDisks(const std::string& vmName) {
    auto instance = api_->getInstance(vmName);
    if (instance.isErr()) {
        return instance.unwrapErr();
    }
    const auto& body = instance.unwrap();

    std::vector<DiskResource> disks;
    if (!body.contains("disks")) {
        return disks;
    }
    for (const auto& attached : body["disks"]) {
        int index = attached.value("index", 0);
        if (index < 0 || index >= 26) {
            return makeError(ErrorKind::ParseError, "Disk index out of range on " + vmName);
        }

        DiskResource disk;
        disk.target = std::string("sd") + static_cast<char>('a' + index);
        disk.location = utils::baseName(attached.value("source", std::string()));
        disk.serial = attached.value("deviceName", std::string());

        Result<int64_t> sizeGb = makeError(ErrorKind::ParseError, "No size reported");
        if (attached.contains("diskSizeGb")) {
            sizeGb = parseSizeGb(attached["diskSizeGb"]);
        } else {
            auto resource = api_->getDisk(disk.location);
            if (resource.isErr()) {
                return resource.unwrapErr();
            }
            sizeGb = parseSizeGb(resource.unwrap().value("sizeGb", nlohmann::json()));
        }
        if (sizeGb.isErr()) {
            return sizeGb.unwrapErr();
        }
        disk.sizeBytes = static_cast<uint64_t>(sizeGb.unwrap()) * kGiB;
        disks.push_back(disk);
    }
    return disks;
}

Result<std::string> GcpBackend::createDiskImage(const std::string& vmName, const std::string& diskName,
                                                uint64_t sizeBytes) {
    int64_t sizeGb = bytesToGib(sizeBytes);
    if (sizeBytes % kGiB != 0) {
        Logger::warning("Rounding disk " + diskName + " up to " + std::to_string(sizeGb) + " GiB");
    }
    nlohmann::json disk = {
        {"name", diskName},
        {"sizeGb", std::to_string(sizeGb)},
        {"description", "Data disk of " + vmName},
    };
    Status created = complete(api_->insertDisk(disk), "create disk " + diskName);
    if (created.isErr()) {
        return created.error();
    }
    return diskName;
}

Status GcpBackend::attachDisk(const std::string& vmName, const DiskAttachment& disk, bool live) {
    (void)live;  // attaching is always live and persistent on gcp
    nlohmann::json attachedDisk = {
        {"source", api_->diskSource(disk.location)},
        {"deviceName", disk.serial},
        {"mode", "READ_WRITE"},
        {"autoDelete", false},
    };
    return complete(api_->attachDisk(vmName, attachedDisk), "attach disk " + disk.location + " to " + vmName);
}

Status GcpBackend::detachDisk(const std::string& vmName, const DiskResource& disk, bool live) {
    (void)live;
    return complete(api_->detachDisk(vmName, disk.serial), "detach disk " + disk.serial + " from " + vmName);
}

Status GcpBackend::deleteDiskImage(const std::string& location) {
    std::string disk = utils::baseName(location);
    return complete(api_->deleteDisk(disk), "delete disk " + disk);
}

Status GcpBackend::resizeDiskImage(const std::string& location, uint64_t deltaBytes) {
    std::string disk = utils::baseName(location);
    auto resource = api_->getDisk(disk);
    if (resource.isErr()) {
        return resource.status();
    }
    auto current = parseSizeGb(resource.unwrap().value("sizeGb", nlohmann::json()));
    if (current.isErr()) {
        return current.status();
    }
    int64_t target = current.unwrap() + bytesToGib(deltaBytes);
    Logger::info("Resizing disk " + disk + " from " + std::to_string(current.unwrap()) + " GiB to " +
                 std::to_string(target) + " GiB");
    return complete(api_->resizeDisk(disk, target), "resize disk " + disk);
}

Status GcpBackend::ejectMedia(const std::string& vmName, const std::string& target) {
    return notSupported("Ejecting " + target + " of " + vmName);
}

Status GcpBackend::removeMediaDevice(const std::string& vmName, const std::string& target, bool live) {
    (void)live;
    return notSupported("Removing media device " + target + " of " + vmName);
}

Result<std::vector<NetworkInterface>> GcpBackend::listInterfaces(const std::string& vmName, bool running) {
    auto instance = api_->getInstance(vmName);
    if (instance.isErr()) {
        return instance.unwrapErr();
    }
    const auto& body = instance.unwrap();

    std::vector<NetworkInterface> interfaces;
    if (!body.contains("networkInterfaces")) {
        return interfaces;
    }
    for (const auto& entry : body["networkInterfaces"]) {
        NetworkInterface nic;
        nic.name = entry.value("name", std::string());
        nic.source = utils::baseName(entry.value("network", std::string()));
        nic.model = entry.value("nicType", std::string());
        if (running) {
            nic.ip = entry.value("networkIP", std::string());
            nic.subnet = utils::baseName(entry.value("subnetwork", std::string()));
        }
        interfaces.push_back(nic);
    }
    return interfaces;
}

Status GcpBackend::attachInterface(const std::string& vmName, const InterfaceSpec& spec, bool live) {
    (void)spec;
    (void)live;
    return notSupported("Adding a network interface to " + vmName);
}

Status GcpBackend::detachInterface(const std::string& vmName, const std::string& mac, bool live) {
    (void)live;
    return notSupported("Removing interface " + mac + " from " + vmName);
}
