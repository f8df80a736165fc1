#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "common/result.hpp"
#include "common/vm_types.hpp"

struct BlockDevice {
    std::string target;
    std::string source;
};

// Parsers for virsh text output and builders for the device descriptors
// handed to attach-device/detach-device.
class VirshOutput {
public:
    // "running" -> Running, "shut off" -> Stopped, "paused" -> Paused, anything else Undefined.
    static VmState stateFromText(const std::string& text);

    // `virsh list --all`
    static InstanceInventory parseDomainList(const std::string& output);
    // `virsh dominfo <name>`
    static Result<VmState> parseDomainState(const std::string& output);
    // `virsh domblklist <name>`, entries without a backing path are skipped
    static std::vector<BlockDevice> parseBlockList(const std::string& output);
    // `virsh domblklist <name>`, every target row whether or not a medium is loaded
    static std::vector<std::string> parseBlockTargets(const std::string& output);
    // `virsh domblkinfo <name> <target>`
    static Result<uint64_t> parseBlockCapacity(const std::string& output);
    // `virsh guestinfo <name>`, if.N.* keys
    static std::vector<NetworkInterface> parseGuestInterfaces(const std::string& output);
    // `virsh dumpxml <name>`, <interface> elements
    static std::vector<NetworkInterface> parseDomainXmlInterfaces(const std::string& xml);

    static std::string interfaceAddXml(const InterfaceSpec& spec);
    static std::string interfaceRemoveXml(const std::string& mac);
    static std::string diskRemoveXml(const std::string& location, const std::string& target);
};
