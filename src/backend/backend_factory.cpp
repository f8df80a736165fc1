#include "backend/backend_factory.hpp"
#include "backend/gcp/compute_rest_client.hpp"
#include "backend/gcp/gcp_backend.hpp"
#include "backend/kvm/domain_inventory.hpp"
#include "backend/kvm/kvm_backend.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <stdexcept>

Result<std::string> resolveAccessToken(const GcpConfig& config, CommandRunner& runner) {
    if (!config.accessToken.empty()) {
        return config.accessToken;
    }

    auto words = utils::splitWhitespace(config.accessTokenCommand);
    if (words.empty()) {
        return makeError(ErrorKind::NotFound, "No access token and no access token command configured");
    }
    std::string command = words.front();
    std::vector<std::string> args(words.begin() + 1, words.end());

    ExecResult result = runner.run(command, args);
    if (!result.succeeded()) {
        Logger::error("Command: " + formatCommand(command, args) + "\nExit Code: " +
                      std::to_string(result.exitCode) + "\nError: " + result.stderrOutput);
        return makeError(ErrorKind::TransportFailure, "Failed to obtain access token: " + result.stderrOutput);
    }

    auto lines = utils::splitLines(result.stdoutOutput);
    std::string token = lines.empty() ? std::string() : utils::trim(lines.front());
    if (token.empty()) {
        return makeError(ErrorKind::ParseError, config.accessTokenCommand + " printed no token");
    }
    return token;
}

Status createBackend(const ControllerConfig& config,
                     CommandRunner& runner,
                     const Poller& poller,
                     std::unique_ptr<HypervisorBackend>& backend) {
    Logger::debug("Creating backend of type: " + config.backend);

    if (config.backend == "kvm") {
        std::unique_ptr<DomainInventory> inventory;
        if (config.kvm.inventorySource == "libvirt") {
            inventory = std::make_unique<LibvirtInventory>(config.kvm.uri);
        } else {
            inventory = std::make_unique<VirshInventory>(runner, config.kvm.virshPath);
        }
        backend = std::make_unique<KvmBackend>(config.kvm, runner, std::move(inventory));
        return Status::ok();
    }

    if (config.backend == "gcp") {
        if (config.gcp.projectId.empty()) {
            Logger::error("gcp.project_id is not configured");
            return makeError(ErrorKind::NotFound, "gcp.project_id is not configured");
        }
        auto token = resolveAccessToken(config.gcp, runner);
        if (token.isErr()) {
            return token.status();
        }
        std::unique_ptr<ComputeApi> api;
        try {
            api = std::make_unique<ComputeRestClient>(config.gcp, token.unwrap());
        } catch (const std::runtime_error& e) {
            return makeError(ErrorKind::TransportFailure, e.what());
        }
        backend = std::make_unique<GcpBackend>(config.gcp, std::move(api), poller);
        return Status::ok();
    }

    Logger::error("Unsupported backend type: " + config.backend);
    return makeError(ErrorKind::ParseError, "Unsupported backend type: " + config.backend);
}
