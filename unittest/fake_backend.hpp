#pragma once

#include <algorithm>
#include <map>
#include <string>
#include <vector>
#include "backend/hypervisor_backend.hpp"

// In-memory hypervisor. Every call is appended to calls() as "<method>:<vm>[:detail]".
class FakeBackend : public HypervisorBackend {
public:
    struct AttachCall {
        std::string vm;
        DiskAttachment disk;
        bool live;
    };

    std::map<std::string, VmState> vms;
    std::map<std::string, std::vector<DiskResource>> disks;
    std::map<std::string, std::vector<std::string>> emptyDrives;  // drives left after an eject
    std::map<std::string, std::vector<NetworkInterface>> interfaces;
    std::map<std::string, std::string> addresses;  // reported once running

    bool gracefulShutdownWorks = true;
    bool forceStopWorks = true;
    bool undefineWorks = true;
    std::map<std::string, Error> failures;  // method name -> error it returns

    std::vector<std::string> calls;
    std::vector<AttachCall> attachCalls;
    std::vector<uint64_t> createdSizes;
    std::vector<std::pair<std::string, uint64_t>> resizes;

    void addVm(const std::string& name, VmState state, const std::string& ip = "192.168.122.10") {
        vms[name] = state;
        addresses[name] = ip;
        disks[name].push_back({"sda", "/k2g/vms/" + name + "/boot.qcow2", name + "-boot", 10ULL << 30});
    }

    size_t count(const std::string& prefix) const {
        return std::count_if(calls.begin(), calls.end(),
                             [&prefix](const std::string& call) { return call.rfind(prefix, 0) == 0; });
    }

    std::string name() const override { return "fake"; }

    Result<InstanceInventory> listInstances() override {
        if (failures.count("listInstances")) return failures["listInstances"];
        InstanceInventory inventory;
        for (const auto& vm : vms) {
            switch (vm.second) {
                case VmState::Running: inventory.running.push_back(vm.first); break;
                case VmState::Stopped: inventory.stopped.push_back(vm.first); break;
                case VmState::Paused:  inventory.paused.push_back(vm.first); break;
                case VmState::Undefined: break;
            }
        }
        return inventory;
    }

    Result<VmState> getState(const std::string& vm) override {
        auto it = vms.find(vm);
        if (it == vms.end()) return makeError(ErrorKind::NotFound, vm);
        return it->second;
    }

    Result<std::string> getIpAddress(const std::string& vm) override {
        if (vms.count(vm) == 0 || vms[vm] != VmState::Running) {
            return makeError(ErrorKind::TransportFailure, "guest agent not responding");
        }
        return addresses[vm];
    }

    Status start(const std::string& vm) override {
        calls.push_back("start:" + vm);
        if (failures.count("start")) return failures["start"];
        vms[vm] = VmState::Running;
        return Status::ok();
    }

    Status shutdown(const std::string& vm) override {
        calls.push_back("shutdown:" + vm);
        if (failures.count("shutdown")) return failures["shutdown"];
        if (gracefulShutdownWorks) vms[vm] = VmState::Stopped;
        return Status::ok();
    }

    Status forceStop(const std::string& vm) override {
        calls.push_back("forceStop:" + vm);
        if (failures.count("forceStop")) return failures["forceStop"];
        if (forceStopWorks) vms[vm] = VmState::Stopped;
        return Status::ok();
    }

    Status reset(const std::string& vm) override {
        calls.push_back("reset:" + vm);
        return Status::ok();
    }

    Status reboot(const std::string& vm) override {
        calls.push_back("reboot:" + vm);
        return Status::ok();
    }

    Status undefine(const std::string& vm) override {
        calls.push_back("undefine:" + vm);
        if (failures.count("undefine")) return failures["undefine"];
        if (undefineWorks) vms.erase(vm);
        return Status::ok();
    }

    Status removeInstanceFiles(const std::string& vm) override {
        calls.push_back("removeInstanceFiles:" + vm);
        disks.erase(vm);
        return Status::ok();
    }

    Result<std::vector<DiskResource>> listDisks(const std::string& vm) override {
        return disks[vm];
    }

    Result<std::vector<std::string>> listTargets(const std::string& vm) override {
        std::vector<std::string> targets = emptyDrives[vm];
        for (const auto& disk : disks[vm]) {
            targets.push_back(disk.target);
        }
        return targets;
    }

    Result<std::string> createDiskImage(const std::string& vm, const std::string& diskName,
                                        uint64_t sizeBytes) override {
        calls.push_back("createDiskImage:" + vm + ":" + diskName);
        if (failures.count("createDiskImage")) return failures["createDiskImage"];
        createdSizes.push_back(sizeBytes);
        return "/k2g/vms/" + vm + "/" + diskName + ".qcow2";
    }

    Status attachDisk(const std::string& vm, const DiskAttachment& disk, bool live) override {
        calls.push_back("attachDisk:" + vm + ":" + disk.target);
        attachCalls.push_back({vm, disk, live});
        disks[vm].push_back({disk.target, disk.location, disk.serial, 0});
        return Status::ok();
    }

    Status detachDisk(const std::string& vm, const DiskResource& disk, bool live) override {
        calls.push_back("detachDisk:" + vm + ":" + disk.target + (live ? ":live" : ""));
        auto& list = disks[vm];
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [&disk](const DiskResource& d) { return d.target == disk.target; }),
                   list.end());
        return Status::ok();
    }

    Status deleteDiskImage(const std::string& location) override {
        calls.push_back("deleteDiskImage:" + location);
        return Status::ok();
    }

    Status resizeDiskImage(const std::string& location, uint64_t deltaBytes) override {
        calls.push_back("resizeDiskImage:" + location);
        resizes.emplace_back(location, deltaBytes);
        return Status::ok();
    }

    Status ejectMedia(const std::string& vm, const std::string& target) override {
        calls.push_back("ejectMedia:" + vm + ":" + target);
        auto& list = disks[vm];
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [&target](const DiskResource& d) { return d.target == target; }),
                   list.end());
        emptyDrives[vm].push_back(target);
        return Status::ok();
    }

    Status removeMediaDevice(const std::string& vm, const std::string& target, bool live) override {
        calls.push_back("removeMediaDevice:" + vm + ":" + target + (live ? ":live" : ""));
        auto& drives = emptyDrives[vm];
        drives.erase(std::remove(drives.begin(), drives.end(), target), drives.end());
        return Status::ok();
    }

    Result<std::vector<NetworkInterface>> listInterfaces(const std::string& vm, bool running) override {
        calls.push_back(std::string("listInterfaces:") + vm + (running ? ":guest" : ":definition"));
        return interfaces[vm];
    }

    Status attachInterface(const std::string& vm, const InterfaceSpec& spec, bool live) override {
        calls.push_back("attachInterface:" + vm + ":" + spec.bridge + (live ? ":live" : ""));
        NetworkInterface nic;
        nic.mac = "52:54:00:00:00:" + std::to_string(10 + interfaces[vm].size());
        nic.source = spec.bridge;
        nic.model = spec.model;
        interfaces[vm].push_back(nic);
        return Status::ok();
    }

    Status detachInterface(const std::string& vm, const std::string& mac, bool live) override {
        calls.push_back("detachInterface:" + vm + ":" + mac + (live ? ":live" : ""));
        auto& list = interfaces[vm];
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [&mac](const NetworkInterface& nic) { return nic.mac == mac; }),
                   list.end());
        return Status::ok();
    }
};
