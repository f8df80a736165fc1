#include "backend/backend_factory.hpp"
#include "common/command_runner.hpp"
#include "common/controller_config.hpp"
#include "common/logger.hpp"
#include "main/cli.hpp"
#include "provision/ansible_provisioner.hpp"
#include "provision/port_probe.hpp"
#include <iostream>
#include <memory>
#include <string>

namespace {

// The default file is optional, an explicitly named one is not.
bool loadConfig(const GlobalOptions& options, ControllerConfig& config) {
    const bool explicitPath = !options.configPath.empty();
    const std::string path = explicitPath ? options.configPath : ConfigLoader::kDefaultPath;

    auto loaded = ConfigLoader::loadFromFile(path);
    if (loaded.isOk()) {
        config = loaded.unwrap();
        return true;
    }
    if (!explicitPath && loaded.kind() == ErrorKind::NotFound) {
        config = ControllerConfig();
        return true;
    }
    std::cerr << "Error: " << loaded.message() << std::endl;
    return false;
}

}  // namespace

int main(int argc, char** argv) {
    GlobalOptions options;
    std::string error;
    if (!parseGlobalOptions(argc, argv, options, error)) {
        std::cerr << "Error: " << error << std::endl;
        printUsage(std::cerr);
        return 1;
    }

    if (options.help) {
        printUsage(std::cout);
        return 0;
    }

    if (options.command.empty()) {
        std::cerr << "Error: No command specified" << std::endl;
        printUsage(std::cerr);
        return 1;
    }

    ControllerConfig config;
    if (!loadConfig(options, config)) {
        return 1;
    }
    if (!options.backend.empty()) {
        config.backend = options.backend;
    }

    LogLevel level = options.debug ? LogLevel::DEBUG : Logger::levelFromString(config.logging.level);
    if (!Logger::initialize(config.logging.path, level)) {
        std::cerr << "Failed to initialize logger" << std::endl;
        return 1;
    }

    try {
        ProcessCommandRunner runner;
        Poller poller;

        std::unique_ptr<HypervisorBackend> backend;
        Status created = createBackend(config, runner, poller, backend);
        if (created.isErr()) {
            Logger::error("Cannot use backend " + config.backend + ": " + created.message());
            Logger::shutdown();
            return 1;
        }

        TcpPortProbe probe;
        AnsibleProvisioner provisioner(config.provision, runner, probe, poller);
        ControllerCLI cli(*backend, provisioner, config, poller, interactiveConfirmation(), std::cout);

        int rc = cli.run(options.command, options.args);
        Logger::shutdown();
        return rc;
    } catch (const std::exception& e) {
        Logger::error("Error in main: " + std::string(e.what()));
        Logger::shutdown();
        return 1;
    }
}
