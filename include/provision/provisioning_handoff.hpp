#pragma once

#include <map>
#include <string>
#include "common/result.hpp"

using ExtraVars = std::map<std::string, std::string>;

// Hands a reachable VM over to the configuration management tool.
class ProvisioningHandoff {
public:
    virtual ~ProvisioningHandoff() = default;

    // Runs playbook (a name relative to the playbook directory) against the
    // single host name -> ip with extraVars passed as extra variables.
    virtual Status run(const std::string& ip, const std::string& name,
                       const std::string& playbook, const ExtraVars& extraVars) = 0;

    // Forgets everything stored for the host.
    virtual Status removeClient(const std::string& name) = 0;
};
