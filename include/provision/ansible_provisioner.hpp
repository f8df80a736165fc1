#pragma once

#include <string>
#include "common/command_runner.hpp"
#include "common/controller_config.hpp"
#include "common/poller.hpp"
#include "provision/port_probe.hpp"
#include "provision/provisioning_handoff.hpp"

/**
 * AnsibleProvisioner - runs ansible-playbook against one freshly reachable VM.
 *
 * Each host gets a client directory <client_dir>/<name> holding the
 * inventory.json and extravars.json of its latest run.
 */
class AnsibleProvisioner : public ProvisioningHandoff {
public:
    AnsibleProvisioner(const ProvisionConfig& config, CommandRunner& runner, PortProbe& probe, Poller poller);

    Status run(const std::string& ip, const std::string& name,
               const std::string& playbook, const ExtraVars& extraVars) override;
    Status removeClient(const std::string& name) override;

    std::string clientDirectory(const std::string& name) const;

private:
    Status waitForSsh(const std::string& ip);
    Status writeClientFiles(const std::string& ip, const std::string& name, const ExtraVars& extraVars);

    ProvisionConfig config_;
    CommandRunner& runner_;
    PortProbe& probe_;
    Poller poller_;
};
