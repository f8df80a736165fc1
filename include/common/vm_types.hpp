#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

enum class VmState {
    Running,
    Stopped,
    Paused,
    Undefined
};

inline const char* vmStateName(VmState state) {
    switch (state) {
        case VmState::Running:   return "running";
        case VmState::Stopped:   return "stopped";
        case VmState::Paused:    return "paused";
        case VmState::Undefined: return "undefined";
    }
    return "undefined";
}

// Every VM known to a backend, partitioned by power state.
struct InstanceInventory {
    std::vector<std::string> running;
    std::vector<std::string> stopped;
    std::vector<std::string> paused;

    VmState stateOf(const std::string& name) const {
        auto has = [&name](const std::vector<std::string>& names) {
            return std::find(names.begin(), names.end(), name) != names.end();
        };
        if (has(running)) return VmState::Running;
        if (has(stopped)) return VmState::Stopped;
        if (has(paused)) return VmState::Paused;
        return VmState::Undefined;
    }

    bool contains(const std::string& name) const { return stateOf(name) != VmState::Undefined; }

    void sort() {
        std::sort(running.begin(), running.end());
        std::sort(stopped.begin(), stopped.end());
        std::sort(paused.begin(), paused.end());
    }
};

struct DiskResource {
    std::string target;    // device slot, "sda" is the boot disk
    std::string location;  // backing file path (local) or disk name (cloud)
    std::string serial;
    uint64_t sizeBytes{0};

    bool isBootDisk() const { return target == "sda"; }
    bool isInstallMedia() const {
        return location.size() >= 4 && location.compare(location.size() - 4, 4, ".iso") == 0;
    }
};

struct NetworkInterface {
    std::string name;    // guest name, only known while running
    std::string mac;
    std::string source;  // bridge or network
    std::string model;
    std::string ip;      // guest reported, only while running
    std::string subnet;  // prefix length of ip
};

struct InterfaceSpec {
    std::string bridge;
    std::string model;
};
