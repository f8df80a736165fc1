#pragma once

#include <memory>
#include <string>
#include "backend/hypervisor_backend.hpp"
#include "common/command_runner.hpp"
#include "common/controller_config.hpp"
#include "common/poller.hpp"

// Builds the backend named by config.backend ("kvm" or "gcp").
// runner must outlive the returned backend.
Status createBackend(const ControllerConfig& config,
                     CommandRunner& runner,
                     const Poller& poller,
                     std::unique_ptr<HypervisorBackend>& backend);

// access_token if set, else the first line printed by access_token_command.
Result<std::string> resolveAccessToken(const GcpConfig& config, CommandRunner& runner);
