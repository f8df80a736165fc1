#include "backend/kvm/virsh_output.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <regex>
#include <sstream>

namespace {

std::string xmlEscape(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '&':  escaped += "&amp;"; break;
            case '<':  escaped += "&lt;"; break;
            case '>':  escaped += "&gt;"; break;
            case '\'': escaped += "&apos;"; break;
            case '"':  escaped += "&quot;"; break;
            default:   escaped += c; break;
        }
    }
    return escaped;
}

struct GuestAddress {
    std::string type;
    std::string addr;
    std::string prefix;
};

struct GuestInterface {
    std::string name;
    std::string hwaddr;
    std::map<int, GuestAddress> addresses;
};

std::optional<int> parseIndex(const std::string& text) {
    if (text.empty() || text.size() > 6 ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    return std::stoi(text);
}

}  // namespace

VmState VirshOutput::stateFromText(const std::string& text) {
    std::string state = utils::trim(text);
    if (state == "running") return VmState::Running;
    if (state == "shut off") return VmState::Stopped;
    if (state == "paused") return VmState::Paused;
    return VmState::Undefined;
}

InstanceInventory VirshOutput::parseDomainList(const std::string& output) {
    InstanceInventory inventory;
    for (const auto& line : utils::splitLines(output)) {
        auto tokens = utils::splitWhitespace(line);
        if (tokens.size() < 3 || tokens[0] == "Id" || utils::startsWith(tokens[0], "--")) {
            continue;
        }

        std::string stateText = tokens[2];
        for (size_t i = 3; i < tokens.size(); ++i) {
            stateText += " " + tokens[i];
        }

        switch (stateFromText(stateText)) {
            case VmState::Running: inventory.running.push_back(tokens[1]); break;
            case VmState::Stopped: inventory.stopped.push_back(tokens[1]); break;
            case VmState::Paused:  inventory.paused.push_back(tokens[1]); break;
            case VmState::Undefined: break;
        }
    }
    return inventory;
}

Result<VmState> VirshOutput::parseDomainState(const std::string& output) {
    for (const auto& line : utils::splitLines(output)) {
        if (utils::startsWith(line, "State:")) {
            return stateFromText(line.substr(line.find(':') + 1));
        }
    }
    return makeError(ErrorKind::ParseError, "dominfo output has no State line");
}

std::vector<BlockDevice> VirshOutput::parseBlockList(const std::string& output) {
    std::vector<BlockDevice> devices;
    for (const auto& line : utils::splitLines(output)) {
        if (line.find('/') == std::string::npos) {
            continue;
        }
        auto tokens = utils::splitWhitespace(line);
        if (tokens.size() < 2) {
            continue;
        }
        devices.push_back({tokens[0], tokens[1]});
    }
    return devices;
}

std::vector<std::string> VirshOutput::parseBlockTargets(const std::string& output) {
    std::vector<std::string> targets;
    for (const auto& line : utils::splitLines(output)) {
        auto tokens = utils::splitWhitespace(line);
        if (tokens.empty() || tokens[0] == "Target" || utils::startsWith(tokens[0], "-")) {
            continue;
        }
        targets.push_back(tokens[0]);
    }
    return targets;
}

Result<uint64_t> VirshOutput::parseBlockCapacity(const std::string& output) {
    for (const auto& line : utils::splitLines(output)) {
        if (!utils::startsWith(line, "Capacity:")) {
            continue;
        }
        std::string value = utils::trim(line.substr(line.find(':') + 1));
        size_t consumed = 0;
        uint64_t capacity = 0;
        try {
            capacity = std::stoull(value, &consumed);
        } catch (const std::exception& e) {
            return makeError(ErrorKind::ParseError, "Invalid capacity value '" + value + "': " + e.what());
        }
        if (consumed != value.size()) {
            return makeError(ErrorKind::ParseError, "Invalid capacity value: " + value);
        }
        return capacity;
    }
    return makeError(ErrorKind::ParseError, "domblkinfo output has no Capacity line");
}

std::vector<NetworkInterface> VirshOutput::parseGuestInterfaces(const std::string& output) {
    std::map<int, GuestInterface> guest;
    for (const auto& line : utils::splitLines(output)) {
        std::string trimmed = utils::trim(line);
        if (!utils::startsWith(trimmed, "if.") || utils::startsWith(trimmed, "if.count")) {
            continue;
        }
        auto colon = trimmed.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string key = utils::trim(trimmed.substr(0, colon));
        std::string value = utils::trim(trimmed.substr(colon + 1));

        // if.<N>.<field...>
        auto dot = key.find('.', 3);
        if (dot == std::string::npos) {
            continue;
        }
        auto index = parseIndex(key.substr(3, dot - 3));
        if (!index) {
            continue;
        }
        std::string field = key.substr(dot + 1);
        GuestInterface& iface = guest[*index];

        if (field == "name") {
            iface.name = value;
        } else if (field == "hwaddr") {
            iface.hwaddr = value;
        } else if (utils::startsWith(field, "addr.") && field != "addr.count") {
            auto second = field.find('.', 5);
            if (second == std::string::npos) {
                continue;
            }
            auto addrIndex = parseIndex(field.substr(5, second - 5));
            if (!addrIndex) {
                continue;
            }
            std::string attribute = field.substr(second + 1);
            GuestAddress& address = iface.addresses[*addrIndex];
            if (attribute == "type") {
                address.type = value;
            } else if (attribute == "addr") {
                address.addr = value;
            } else if (attribute == "prefix") {
                address.prefix = value;
            }
        }
    }

    std::vector<NetworkInterface> interfaces;
    for (const auto& entry : guest) {
        const GuestInterface& iface = entry.second;
        NetworkInterface nic;
        nic.name = iface.name;
        nic.mac = iface.hwaddr;

        // Prefer the first IPv4 address; addr.0 otherwise.
        const GuestAddress* chosen = nullptr;
        for (const auto& address : iface.addresses) {
            if (address.second.type == "ipv4" || utils::isValidIPv4(address.second.addr)) {
                chosen = &address.second;
                break;
            }
        }
        if (!chosen) {
            auto first = iface.addresses.find(0);
            if (first != iface.addresses.end()) {
                chosen = &first->second;
            }
        }
        if (chosen) {
            nic.ip = chosen->addr;
            nic.subnet = chosen->prefix;
        }
        interfaces.push_back(nic);
    }
    return interfaces;
}

std::vector<NetworkInterface> VirshOutput::parseDomainXmlInterfaces(const std::string& xml) {
    static const std::regex interfaceRegex("<interface\\b[^>]*>([\\s\\S]*?)</interface>");
    static const std::regex macRegex("<mac\\s+address=['\"]([^'\"]+)['\"]");
    static const std::regex sourceRegex("<source\\s+(?:bridge|network)=['\"]([^'\"]+)['\"]");
    static const std::regex modelRegex("<model\\s+type=['\"]([^'\"]+)['\"]");

    std::vector<NetworkInterface> interfaces;
    auto begin = std::sregex_iterator(xml.begin(), xml.end(), interfaceRegex);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        std::string body = (*it)[1].str();
        NetworkInterface nic;
        std::smatch match;
        if (std::regex_search(body, match, macRegex)) {
            nic.mac = match[1];
        }
        if (std::regex_search(body, match, sourceRegex)) {
            nic.source = match[1];
        }
        if (std::regex_search(body, match, modelRegex)) {
            nic.model = match[1];
        }
        interfaces.push_back(nic);
    }
    return interfaces;
}

std::string VirshOutput::interfaceAddXml(const InterfaceSpec& spec) {
    std::ostringstream xml;
    xml << "<interface type='bridge'>\n"
        << "  <source bridge='" << xmlEscape(spec.bridge) << "'/>\n"
        << "  <model type='" << xmlEscape(spec.model) << "'/>\n"
        << "</interface>\n";
    return xml.str();
}

std::string VirshOutput::interfaceRemoveXml(const std::string& mac) {
    std::ostringstream xml;
    xml << "<interface type='bridge'>\n"
        << "  <mac address='" << xmlEscape(mac) << "'/>\n"
        << "</interface>\n";
    return xml.str();
}

std::string VirshOutput::diskRemoveXml(const std::string& location, const std::string& target) {
    std::ostringstream xml;
    xml << "<disk type='file' device='disk'>\n"
        << "  <source file='" << xmlEscape(location) << "'/>\n"
        << "  <target dev='" << xmlEscape(target) << "' bus='scsi'/>\n"
        << "</disk>\n";
    return xml.str();
}
