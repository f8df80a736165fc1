#include "common/controller_config.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace {

template <typename T>
void readField(const nlohmann::json& section, const char* key, T& field) {
    if (section.contains(key) && !section.at(key).is_null()) {
        field = section.at(key).get<T>();
    }
}

const nlohmann::json& sectionOf(const nlohmann::json& document, const char* key) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (!document.contains(key)) {
        return empty;
    }
    const nlohmann::json& section = document.at(key);
    if (!section.is_object()) {
        throw std::invalid_argument(std::string("section '") + key + "' must be an object");
    }
    return section;
}

}  // namespace

Result<ControllerConfig> ConfigLoader::fromJson(const nlohmann::json& document) {
    if (!document.is_object()) {
        return makeError(ErrorKind::ParseError, "Configuration root must be a JSON object");
    }

    ControllerConfig config;
    try {
        readField(document, "backend", config.backend);

        const auto& kvm = sectionOf(document, "kvm");
        readField(kvm, "uri", config.kvm.uri);
        readField(kvm, "virsh", config.kvm.virshPath);
        readField(kvm, "qemu_img", config.kvm.qemuImgPath);
        readField(kvm, "vm_dir", config.kvm.vmDir);
        readField(kvm, "bridge", config.kvm.bridge);
        readField(kvm, "nic_model", config.kvm.nicModel);
        readField(kvm, "disk_format", config.kvm.diskFormat);
        readField(kvm, "primary_interface", config.kvm.primaryInterface);
        readField(kvm, "inventory_source", config.kvm.inventorySource);

        const auto& gcp = sectionOf(document, "gcp");
        readField(gcp, "project_id", config.gcp.projectId);
        readField(gcp, "zone", config.gcp.zone);
        readField(gcp, "api_endpoint", config.gcp.apiEndpoint);
        readField(gcp, "access_token", config.gcp.accessToken);
        readField(gcp, "access_token_command", config.gcp.accessTokenCommand);
        readField(gcp, "operation_poll_interval_sec", config.gcp.operationPollIntervalSec);
        readField(gcp, "operation_timeout_sec", config.gcp.operationTimeoutSec);
        readField(gcp, "request_timeout_sec", config.gcp.requestTimeoutSec);

        const auto& provision = sectionOf(document, "provision");
        readField(provision, "ansible_playbook", config.provision.ansiblePlaybookPath);
        readField(provision, "playbook_dir", config.provision.playbookDir);
        readField(provision, "client_dir", config.provision.clientDir);
        readField(provision, "private_key", config.provision.privateKey);
        readField(provision, "remote_user", config.provision.remoteUser);
        readField(provision, "ssh_port", config.provision.sshPort);
        readField(provision, "port_wait_interval_sec", config.provision.portWaitIntervalSec);
        readField(provision, "port_wait_attempts", config.provision.portWaitAttempts);

        const auto& timing = sectionOf(document, "timing");
        readField(timing, "start_wait_sec", config.timing.startWaitSec);
        readField(timing, "start_poll_interval_sec", config.timing.startPollIntervalSec);
        readField(timing, "shutdown_wait_sec", config.timing.shutdownWaitSec);
        readField(timing, "forced_shutdown_wait_sec", config.timing.forcedShutdownWaitSec);
        readField(timing, "shutdown_poll_interval_sec", config.timing.shutdownPollIntervalSec);
        readField(timing, "interface_settle_sec", config.timing.interfaceSettleSec);

        const auto& logging = sectionOf(document, "logging");
        readField(logging, "path", config.logging.path);
        readField(logging, "level", config.logging.level);
    } catch (const nlohmann::json::exception& e) {
        return makeError(ErrorKind::ParseError, std::string("Invalid configuration: ") + e.what());
    } catch (const std::invalid_argument& e) {
        return makeError(ErrorKind::ParseError, std::string("Invalid configuration: ") + e.what());
    }

    if (config.backend != "kvm" && config.backend != "gcp") {
        return makeError(ErrorKind::ParseError, "Unknown backend: " + config.backend);
    }
    if (config.kvm.inventorySource != "virsh" && config.kvm.inventorySource != "libvirt") {
        return makeError(ErrorKind::ParseError, "Unknown inventory source: " + config.kvm.inventorySource);
    }
    return config;
}

Result<ControllerConfig> ConfigLoader::loadFromFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return makeError(ErrorKind::NotFound, "Configuration file not found: " + path);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return makeError(ErrorKind::TransportFailure, "Failed to open configuration file: " + path);
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::parse_error& e) {
        Logger::error("Failed to parse configuration " + path + ": " + e.what());
        return makeError(ErrorKind::ParseError, "Failed to parse " + path + ": " + e.what());
    }

    Logger::debug("Loaded configuration from " + path);
    return fromJson(document);
}
