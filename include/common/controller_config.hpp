#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "common/result.hpp"

// Set by the build to the installed playbook directory.
#ifndef VMSTEWARD_PLAYBOOK_DIR
#define VMSTEWARD_PLAYBOOK_DIR "/usr/local/share/vmsteward/ansible/playbooks"
#endif

struct KvmConfig {
    std::string uri = "qemu:///system";
    std::string virshPath = "virsh";
    std::string qemuImgPath = "qemu-img";
    std::string vmDir = "/k2g/vms";
    std::string bridge = "virbr0";
    std::string nicModel = "virtio";
    std::string diskFormat = "qcow2";
    std::string primaryInterface = "eth0";
    std::string inventorySource = "virsh";  // "virsh" or "libvirt"
};

struct GcpConfig {
    std::string projectId;
    std::string zone = "us-central1-a";
    std::string apiEndpoint = "https://compute.googleapis.com/compute/v1";
    std::string accessToken;
    std::string accessTokenCommand = "gcloud auth print-access-token";
    int operationPollIntervalSec = 3;
    int operationTimeoutSec = 600;  // 0 waits forever
    int requestTimeoutSec = 300;
};

struct ProvisionConfig {
    std::string ansiblePlaybookPath = "ansible-playbook";
    std::string playbookDir = VMSTEWARD_PLAYBOOK_DIR;
    std::string clientDir = "/k2g/ansible/clients";
    std::string privateKey;
    std::string remoteUser = "ansible";
    int sshPort = 22;
    int portWaitIntervalSec = 5;
    int portWaitAttempts = 24;
};

struct TimingConfig {
    int startWaitSec = 120;
    int startPollIntervalSec = 5;
    int shutdownWaitSec = 60;
    int forcedShutdownWaitSec = 10;
    int shutdownPollIntervalSec = 1;
    int interfaceSettleSec = 5;
};

struct LoggingConfig {
    std::string path = "/tmp/vmsteward.log";
    std::string level = "INFO";
};

struct ControllerConfig {
    std::string backend = "kvm";  // "kvm" or "gcp"
    KvmConfig kvm;
    GcpConfig gcp;
    ProvisionConfig provision;
    TimingConfig timing;
    LoggingConfig logging;
};

class ConfigLoader {
public:
    static constexpr const char* kDefaultPath = "/etc/vmsteward/config.json";

    static Result<ControllerConfig> loadFromFile(const std::string& path);
    static Result<ControllerConfig> fromJson(const nlohmann::json& document);
};
