#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "backend/hypervisor_backend.hpp"
#include "common/confirmation.hpp"
#include "common/controller_config.hpp"
#include "common/poller.hpp"
#include "controller/disk_manager.hpp"
#include "controller/lifecycle_manager.hpp"
#include "controller/network_manager.hpp"
#include "provision/provisioning_handoff.hpp"

struct GlobalOptions {
    std::string configPath;
    std::string backend;
    bool debug = false;
    bool help = false;
    std::string command;
    std::vector<std::string> args;
};

// Splits "[--config f] [--backend b] [--debug] <command> ..." into options and
// the command with its own arguments. False on a malformed global option.
bool parseGlobalOptions(int argc, char** argv, GlobalOptions& options, std::string& error);

void printUsage(std::ostream& out);

// Reads y/yes (any case) from stdin; anything else declines.
ConfirmationPolicy interactiveConfirmation();

class ControllerCLI {
public:
    ControllerCLI(HypervisorBackend& backend,
                  ProvisioningHandoff& provisioner,
                  const ControllerConfig& config,
                  Poller poller,
                  ConfirmationPolicy confirmation,
                  std::ostream& out);

    // Exit status: 0 on success, 1 on failure or bad usage.
    int run(const std::string& command, const std::vector<std::string>& args);

private:
    struct CommandArgs {
        std::vector<std::string> positional;
        bool force = false;
        bool keepCdrom = false;
        std::string name;
        std::string mount;
    };

    static bool parseCommandArgs(const std::vector<std::string>& args, CommandArgs& parsed, std::string& error);
    int finish(const Status& status, const std::string& command);

    int handleList();
    int handleIp(const CommandArgs& args);
    int handleDisks(const CommandArgs& args);
    int handleAddDisk(const CommandArgs& args);
    int handleAttachDisk(const CommandArgs& args);
    int handleInterfaces(const CommandArgs& args, const std::string& command);

    void printInterfaces(const std::vector<NetworkInterface>& interfaces);

    HypervisorBackend& backend_;
    LifecycleManager lifecycle_;
    DiskManager disks_;
    NetworkManager network_;
    std::ostream& out_;
};
