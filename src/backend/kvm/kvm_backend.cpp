#include "backend/kvm/kvm_backend.hpp"
#include "backend/kvm/virsh_output.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

KvmBackend::KvmBackend(const KvmConfig& config, CommandRunner& runner, std::unique_ptr<DomainInventory> inventory)
    : config_(config), runner_(runner), inventory_(std::move(inventory)) {
    if (!inventory_) {
        inventory_ = std::make_unique<VirshInventory>(runner_, config_.virshPath);
    }
}

KvmBackend::~KvmBackend() = default;

std::string KvmBackend::vmDirectory(const std::string& vmName) const {
    return (fs::path(config_.vmDir) / vmName).string();
}

Result<std::string> KvmBackend::virsh(const std::vector<std::string>& args, bool logFailure) {
    ExecResult result = runner_.run(config_.virshPath, args);
    if (!result.succeeded()) {
        if (logFailure) {
            Logger::error("Command: " + formatCommand(config_.virshPath, args) + "\nExit Code: " +
                          std::to_string(result.exitCode) + "\nError: " + result.stderrOutput);
        }
        return makeError(ErrorKind::TransportFailure,
                         "virsh " + (args.empty() ? std::string() : args.front()) + " failed: " +
                             utils::trim(result.stderrOutput));
    }
    return result.stdoutOutput;
}

Result<std::string> KvmBackend::qemuImg(const std::vector<std::string>& args) {
    ExecResult result = runner_.run(config_.qemuImgPath, args);
    if (!result.succeeded()) {
        Logger::error("Command: " + formatCommand(config_.qemuImgPath, args) + "\nExit Code: " +
                      std::to_string(result.exitCode) + "\nError: " + result.stderrOutput);
        return makeError(ErrorKind::TransportFailure, "qemu-img failed: " + utils::trim(result.stderrOutput));
    }
    return result.stdoutOutput;
}

Status KvmBackend::applyDeviceXml(const std::string& verb, const std::string& vmName,
                                  const std::string& xml, bool live) {
    std::error_code ec;
    fs::path scratch = fs::temp_directory_path(ec);
    if (ec) {
        return makeError(ErrorKind::TransportFailure, "No temporary directory: " + ec.message());
    }
    scratch /= "vmsteward-" + vmName + "-" + utils::randomHex(8) + ".xml";

    {
        std::ofstream out(scratch);
        if (!out) {
            return makeError(ErrorKind::TransportFailure, "Cannot write device descriptor " + scratch.string());
        }
        out << xml;
    }
    Logger::debug("Device descriptor " + scratch.string() + ":\n" + xml);

    std::vector<std::string> args = {verb, vmName, scratch.string()};
    if (live) {
        args.push_back("--live");
    }
    args.push_back("--persistent");
    Status status = virsh(args).status();

    fs::remove(scratch, ec);
    if (ec) {
        Logger::warning("Failed to remove " + scratch.string() + ": " + ec.message());
    }
    return status;
}

Result<InstanceInventory> KvmBackend::listInstances() {
    return inventory_->listInstances();
}

Result<VmState> KvmBackend::getState(const std::string& vmName) {
    return inventory_->getState(vmName);
}

Result<std::string> KvmBackend::getIpAddress(const std::string& vmName) {
    // guestinfo fails until the guest agent answers; that is expected while booting
    auto output = virsh({"guestinfo", vmName}, false);
    if (output.isErr()) {
        return output.unwrapErr();
    }
    for (const auto& nic : VirshOutput::parseGuestInterfaces(output.unwrap())) {
        if (nic.name == config_.primaryInterface && !nic.ip.empty()) {
            return nic.ip;
        }
    }
    return makeError(ErrorKind::NotFound, "No address on " + config_.primaryInterface + " of " + vmName);
}

Status KvmBackend::start(const std::string& vmName) {
    return virsh({"start", vmName}).status();
}

Status KvmBackend::shutdown(const std::string& vmName) {
    return virsh({"shutdown", vmName}).status();
}

Status KvmBackend::forceStop(const std::string& vmName) {
    return virsh({"destroy", vmName}).status();
}

Status KvmBackend::reset(const std::string& vmName) {
    return virsh({"reset", vmName}).status();
}

Status KvmBackend::reboot(const std::string& vmName) {
    return virsh({"reboot", vmName}).status();
}

Status KvmBackend::undefine(const std::string& vmName) {
    return virsh({"undefine", vmName}).status();
}

Status KvmBackend::removeInstanceFiles(const std::string& vmName) {
    std::string dir = vmDirectory(vmName);
    std::error_code ec;
    auto removed = fs::remove_all(dir, ec);
    if (ec) {
        Logger::error("Failed to remove " + dir + ": " + ec.message());
        return makeError(ErrorKind::TransportFailure, "Failed to remove " + dir + ": " + ec.message());
    }
    Logger::debug("Removed " + std::to_string(removed) + " entries under " + dir);
    return Status::ok();
}

Result<std::vector<DiskResource>> KvmBackend::listDisks(const std::string& vmName) {
    auto output = virsh({"domblklist", vmName});
    if (output.isErr()) {
        return output.unwrapErr();
    }

    std::vector<DiskResource> disks;
    for (const auto& device : VirshOutput::parseBlockList(output.unwrap())) {
        auto info = virsh({"domblkinfo", vmName, device.target});
        if (info.isErr()) {
            return info.unwrapErr();
        }
        auto capacity = VirshOutput::parseBlockCapacity(info.unwrap());
        if (capacity.isErr()) {
            return capacity.unwrapErr();
        }

        DiskResource disk;
        disk.target = device.target;
        disk.location = device.source;
        disk.serial = vmName + "-" + utils::stem(device.source);
        disk.sizeBytes = capacity.unwrap();
        disks.push_back(disk);
    }
    return disks;
}

Result<std::vector<std::string>> KvmBackend::listTargets(const std::string& vmName) {
    auto output = virsh({"domblklist", vmName});
    if (output.isErr()) {
        return output.unwrapErr();
    }
    return VirshOutput::parseBlockTargets(output.unwrap());
}

Result<std::string> KvmBackend::createDiskImage(const std::string& vmName, const std::string& diskName,
                                                uint64_t sizeBytes) {
    fs::path dir = vmDirectory(vmName);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        Logger::error("Failed to create " + dir.string() + ": " + ec.message());
        return makeError(ErrorKind::TransportFailure, "Failed to create " + dir.string() + ": " + ec.message());
    }

    std::string file = (dir / (diskName + "." + config_.diskFormat)).string();
    if (fs::exists(file, ec)) {
        return makeError(ErrorKind::StateConflict, "Disk image " + file + " already exists");
    }

    auto created = qemuImg({"create", "-f", config_.diskFormat, file, std::to_string(sizeBytes)});
    if (created.isErr()) {
        return created.unwrapErr();
    }
    Logger::debug("Created " + file + " of " + std::to_string(sizeBytes) + " bytes");
    return file;
}

Status KvmBackend::attachDisk(const std::string& vmName, const DiskAttachment& disk, bool live) {
    std::vector<std::string> args = {"attach-disk", vmName, disk.location,
                                     "--driver", "qemu",
                                     "--subdriver", config_.diskFormat,
                                     "--cache", "none",
                                     "--serial", disk.serial,
                                     "--target", disk.target,
                                     "--targetbus", "scsi"};
    if (live) {
        args.push_back("--live");
    }
    args.push_back("--persistent");
    return virsh(args).status();
}

Status KvmBackend::detachDisk(const std::string& vmName, const DiskResource& disk, bool live) {
    return applyDeviceXml("detach-device", vmName, VirshOutput::diskRemoveXml(disk.location, disk.target), live);
}

Status KvmBackend::deleteDiskImage(const std::string& location) {
    std::error_code ec;
    if (!fs::remove(location, ec)) {
        if (ec) {
            Logger::error("Failed to delete " + location + ": " + ec.message());
            return makeError(ErrorKind::TransportFailure, "Failed to delete " + location + ": " + ec.message());
        }
        return makeError(ErrorKind::NotFound, "Disk image " + location + " does not exist");
    }
    return Status::ok();
}

Status KvmBackend::resizeDiskImage(const std::string& location, uint64_t deltaBytes) {
    return qemuImg({"resize", location, "+" + std::to_string(deltaBytes)}).status();
}

Status KvmBackend::ejectMedia(const std::string& vmName, const std::string& target) {
    return virsh({"change-media", vmName, target, "--eject", "--config"}).status();
}

Status KvmBackend::removeMediaDevice(const std::string& vmName, const std::string& target, bool live) {
    std::vector<std::string> args = {"detach-disk", vmName, target};
    if (live) {
        args.push_back("--live");
    }
    args.push_back("--config");
    return virsh(args).status();
}

Result<std::vector<NetworkInterface>> KvmBackend::listInterfaces(const std::string& vmName, bool running) {
    if (running) {
        auto output = virsh({"guestinfo", vmName});
        if (output.isErr()) {
            return output.unwrapErr();
        }
        return VirshOutput::parseGuestInterfaces(output.unwrap());
    }

    auto xml = virsh({"dumpxml", vmName});
    if (xml.isErr()) {
        return xml.unwrapErr();
    }
    return VirshOutput::parseDomainXmlInterfaces(xml.unwrap());
}

Status KvmBackend::attachInterface(const std::string& vmName, const InterfaceSpec& spec, bool live) {
    return applyDeviceXml("attach-device", vmName, VirshOutput::interfaceAddXml(spec), live);
}

Status KvmBackend::detachInterface(const std::string& vmName, const std::string& mac, bool live) {
    return applyDeviceXml("detach-device", vmName, VirshOutput::interfaceRemoveXml(mac), live);
}
