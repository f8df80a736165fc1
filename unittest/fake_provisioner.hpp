#pragma once

#include <string>
#include <vector>
#include "provision/provisioning_handoff.hpp"

class FakeProvisioner : public ProvisioningHandoff {
public:
    struct Run {
        std::string ip;
        std::string name;
        std::string playbook;
        ExtraVars vars;
    };

    std::vector<Run> runs;
    std::vector<std::string> removedClients;
    bool fail = false;

    Status run(const std::string& ip, const std::string& name,
               const std::string& playbook, const ExtraVars& extraVars) override {
        runs.push_back({ip, name, playbook, extraVars});
        if (fail) {
            return makeError(ErrorKind::TransportFailure, "playbook failed");
        }
        return Status::ok();
    }

    Status removeClient(const std::string& name) override {
        removedClients.push_back(name);
        return Status::ok();
    }
};
