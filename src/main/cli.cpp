#include "main/cli.hpp"
#include "common/logger.hpp"
#include "common/size_units.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <map>

namespace {

// command -> number of positional arguments it takes
const std::map<std::string, size_t> kArity = {
    {"list", 0},         {"purge", 0},
    {"start", 1},        {"stop", 1},         {"force-stop", 1},  {"reboot", 1},
    {"reset", 1},        {"soft-reset", 1},   {"delete", 1},      {"ip", 1},
    {"disks", 1},        {"add-disk", 2},     {"attach-disk", 2}, {"remove-disk", 2},
    {"grow-disk", 3},    {"mount-disk", 3},   {"unmount-disk", 2}, {"eject", 1},
    {"interfaces", 1},   {"eth-interfaces", 1}, {"add-nic", 1},   {"remove-nic", 2},
};

}  // namespace

void printUsage(std::ostream& out) {
    out << "Usage: vmsteward [options] <command> [arguments]\n"
        << "Options:\n"
        << "  --config <file>      Configuration file (default " << ConfigLoader::kDefaultPath << ")\n"
        << "  --backend <kvm|gcp>  Override the configured backend\n"
        << "  --debug              Log debug messages\n"
        << "  -h, --help           Show this help message\n"
        << "\n"
        << "Commands:\n"
        << "  list                               List VMs by state\n"
        << "  start <vm>                         Start a VM and wait for its address\n"
        << "  stop <vm>                          Shut down, forcing it off after the timeout\n"
        << "  force-stop <vm>                    Power a VM off immediately\n"
        << "  reboot <vm>                        Reboot a VM (starts it if stopped)\n"
        << "  reset <vm>                         Hard reset a VM (starts it if stopped)\n"
        << "  soft-reset <vm>                    Shut down, then start a VM\n"
        << "  delete <vm> [--force]              Delete a VM and its files\n"
        << "  purge [--force]                    Delete every VM that is not running\n"
        << "  ip <vm>                            Wait for and print the VM address\n"
        << "  disks <vm>                         List disks\n"
        << "  add-disk <vm> <size> [--name n] [--mount path]\n"
        << "                                     Create and attach a data disk\n"
        << "  attach-disk <vm> <path>            Attach an existing disk image\n"
        << "  remove-disk <vm> <target> [--force]\n"
        << "                                     Detach a data disk and delete its image\n"
        << "  grow-disk <vm> <target> <size> [--force]\n"
        << "                                     Grow a disk and its filesystem\n"
        << "  mount-disk <vm> <target> <path>    Mount a data disk inside the guest\n"
        << "  unmount-disk <vm> <target>         Unmount a data disk inside the guest\n"
        << "  eject <vm> [--keep-cdrom]          Eject installation media\n"
        << "  interfaces <vm>                    List network interfaces\n"
        << "  eth-interfaces <vm>                List the guest's eth* interfaces\n"
        << "  add-nic <vm>                       Add a network interface\n"
        << "  remove-nic <vm> <mac>              Remove a network interface\n";
}

bool parseGlobalOptions(int argc, char** argv, GlobalOptions& options, std::string& error) {
    int i = 1;
    for (; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "--debug") {
            options.debug = true;
        } else if (arg == "--config" || arg == "--backend") {
            if (i + 1 >= argc) {
                error = arg + " requires a value";
                return false;
            }
            (arg == "--config" ? options.configPath : options.backend) = argv[++i];
        } else if (arg.size() > 1 && arg[0] == '-') {
            error = "Unknown option: " + arg;
            return false;
        } else {
            break;
        }
    }
    if (i < argc) {
        options.command = argv[i++];
    }
    for (; i < argc; i++) {
        options.args.emplace_back(argv[i]);
    }
    return true;
}

ConfirmationPolicy interactiveConfirmation() {
    return ConfirmationPolicy::fromCallback([](const std::string& question) {
        std::cout << question << " [y/N] " << std::flush;
        std::string answer;
        if (!std::getline(std::cin, answer)) {
            return false;
        }
        std::transform(answer.begin(), answer.end(), answer.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return answer == "y" || answer == "yes";
    });
}

ControllerCLI::ControllerCLI(HypervisorBackend& backend,
                             ProvisioningHandoff& provisioner,
                             const ControllerConfig& config,
                             Poller poller,
                             ConfirmationPolicy confirmation,
                             std::ostream& out)
    : backend_(backend),
      lifecycle_(backend, config.timing, poller, confirmation, &provisioner),
      disks_(backend, lifecycle_, provisioner, confirmation),
      network_(backend, InterfaceSpec{config.kvm.bridge, config.kvm.nicModel}, config.timing, poller),
      out_(out) {
}

bool ControllerCLI::parseCommandArgs(const std::vector<std::string>& args, CommandArgs& parsed,
                                     std::string& error) {
    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "-f" || arg == "--force") {
            parsed.force = true;
        } else if (arg == "--keep-cdrom") {
            parsed.keepCdrom = true;
        } else if (arg == "--name" || arg == "--mount") {
            if (i + 1 >= args.size()) {
                error = arg + " requires a value";
                return false;
            }
            (arg == "--name" ? parsed.name : parsed.mount) = args[++i];
        } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
            error = "Unknown option: " + arg;
            return false;
        } else {
            parsed.positional.push_back(arg);
        }
    }
    return true;
}

int ControllerCLI::finish(const Status& status, const std::string& command) {
    if (status.isErr()) {
        Logger::error(command + " failed (" + errorKindName(status.kind()) + "): " + status.message());
        return 1;
    }
    return 0;
}

int ControllerCLI::run(const std::string& command, const std::vector<std::string>& args) {
    auto arity = kArity.find(command);
    if (arity == kArity.end()) {
        Logger::error("Unknown command: " + command);
        printUsage(out_);
        return 1;
    }

    CommandArgs parsed;
    std::string error;
    if (!parseCommandArgs(args, parsed, error)) {
        Logger::error(error);
        return 1;
    }
    if (parsed.positional.size() != arity->second) {
        Logger::error(command + " takes " + std::to_string(arity->second) + " argument(s), got " +
                      std::to_string(parsed.positional.size()));
        printUsage(out_);
        return 1;
    }
    Logger::debug("Running " + command + " on " + backend_.name());

    const auto& pos = parsed.positional;
    if (command == "list") {
        return handleList();
    } else if (command == "start") {
        return finish(lifecycle_.start(pos[0]), command);
    } else if (command == "stop") {
        return finish(lifecycle_.shutdown(pos[0]), command);
    } else if (command == "force-stop") {
        return finish(lifecycle_.forceShutdown(pos[0]), command);
    } else if (command == "reboot") {
        return finish(lifecycle_.reboot(pos[0]), command);
    } else if (command == "reset") {
        return finish(lifecycle_.hardReset(pos[0]), command);
    } else if (command == "soft-reset") {
        return finish(lifecycle_.softReset(pos[0]), command);
    } else if (command == "delete") {
        return finish(lifecycle_.deleteVm(pos[0], parsed.force), command);
    } else if (command == "purge") {
        return finish(lifecycle_.purge(parsed.force), command);
    } else if (command == "ip") {
        return handleIp(parsed);
    } else if (command == "disks") {
        return handleDisks(parsed);
    } else if (command == "add-disk") {
        return handleAddDisk(parsed);
    } else if (command == "attach-disk") {
        return handleAttachDisk(parsed);
    } else if (command == "remove-disk") {
        return finish(disks_.removeDataDisk(pos[0], pos[1], parsed.force), command);
    } else if (command == "grow-disk") {
        return finish(disks_.increaseDiskSize(pos[0], pos[1], pos[2], parsed.force), command);
    } else if (command == "mount-disk") {
        return finish(disks_.mountDisk(pos[0], pos[1], pos[2]), command);
    } else if (command == "unmount-disk") {
        return finish(disks_.unmountDisk(pos[0], pos[1]), command);
    } else if (command == "eject") {
        return finish(disks_.ejectInstallMedia(pos[0], !parsed.keepCdrom), command);
    }
    return handleInterfaces(parsed, command);
}

int ControllerCLI::handleList() {
    auto inventory = lifecycle_.listInstances(true);
    if (inventory.isErr()) {
        return finish(inventory.status(), "list");
    }
    const auto& vms = inventory.unwrap();
    auto section = [this](const std::string& title, const std::vector<std::string>& names) {
        out_ << title << " (" << names.size() << ")\n";
        for (const auto& name : names) {
            out_ << "  " << name << "\n";
        }
    };
    section("Running", vms.running);
    section("Stopped", vms.stopped);
    section("Paused", vms.paused);
    return 0;
}

int ControllerCLI::handleIp(const CommandArgs& args) {
    auto state = lifecycle_.tracker().requireExisting(args.positional[0]);
    if (state.isErr()) {
        return finish(state.status(), "ip");
    }
    if (state.unwrap() != VmState::Running) {
        return finish(makeError(ErrorKind::StateConflict, args.positional[0] + " is not running"), "ip");
    }
    auto ip = lifecycle_.waitForIp(args.positional[0]);
    if (ip.isErr()) {
        return finish(ip.status(), "ip");
    }
    out_ << ip.unwrap() << "\n";
    return 0;
}

int ControllerCLI::handleDisks(const CommandArgs& args) {
    auto disks = disks_.listDisks(args.positional[0]);
    if (disks.isErr()) {
        return finish(disks.status(), "disks");
    }
    out_ << std::left << std::setw(8) << "TARGET" << std::setw(14) << "SIZE" << std::setw(28) << "SERIAL"
         << "SOURCE\n";
    for (const auto& disk : disks.unwrap()) {
        out_ << std::left << std::setw(8) << disk.target << std::setw(14) << SizeUnits::toHuman(disk.sizeBytes)
             << std::setw(28) << disk.serial << disk.location << "\n";
    }
    return 0;
}

int ControllerCLI::handleAddDisk(const CommandArgs& args) {
    auto disk = disks_.createDataDisk(args.positional[0], args.positional[1], args.name, args.mount);
    if (disk.isErr()) {
        return finish(disk.status(), "add-disk");
    }
    out_ << disk.unwrap().target << " " << disk.unwrap().location << "\n";
    return 0;
}

int ControllerCLI::handleAttachDisk(const CommandArgs& args) {
    auto disk = disks_.attachExistingDisk(args.positional[0], args.positional[1]);
    if (disk.isErr()) {
        return finish(disk.status(), "attach-disk");
    }
    out_ << disk.unwrap().target << " " << disk.unwrap().location << "\n";
    return 0;
}

int ControllerCLI::handleInterfaces(const CommandArgs& args, const std::string& command) {
    const auto& pos = args.positional;
    Result<std::vector<NetworkInterface>> interfaces = makeError(ErrorKind::ParseError, "Unknown command");
    if (command == "interfaces") {
        interfaces = network_.listInterfaces(pos[0]);
    } else if (command == "eth-interfaces") {
        interfaces = network_.listEthInterfaces(pos[0]);
    } else if (command == "add-nic") {
        interfaces = network_.addInterface(pos[0]);
    } else if (command == "remove-nic") {
        interfaces = network_.removeInterface(pos[0], pos[1]);
    }
    if (interfaces.isErr()) {
        return finish(interfaces.status(), command);
    }
    printInterfaces(interfaces.unwrap());
    return 0;
}

void ControllerCLI::printInterfaces(const std::vector<NetworkInterface>& interfaces) {
    out_ << std::left << std::setw(10) << "NAME" << std::setw(20) << "MAC" << std::setw(12) << "SOURCE"
         << std::setw(10) << "MODEL" << "ADDRESS\n";
    for (const auto& nic : interfaces) {
        std::string address = nic.ip.empty() ? "-" : nic.ip + (nic.subnet.empty() ? "" : "/" + nic.subnet);
        out_ << std::left << std::setw(10) << (nic.name.empty() ? "-" : nic.name)
             << std::setw(20) << (nic.mac.empty() ? "-" : nic.mac)
             << std::setw(12) << (nic.source.empty() ? "-" : nic.source)
             << std::setw(10) << (nic.model.empty() ? "-" : nic.model) << address << "\n";
    }
}
