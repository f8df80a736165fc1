#include "provision/ansible_provisioner.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace {

Status writeJson(const fs::path& path, const nlohmann::json& document) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        Logger::error("Failed to open " + path.string() + " for writing");
        return makeError(ErrorKind::TransportFailure, "Failed to write " + path.string());
    }
    out << document.dump(4) << std::endl;
    if (!out) {
        return makeError(ErrorKind::TransportFailure, "Failed to write " + path.string());
    }
    return Status::ok();
}

}  // namespace

AnsibleProvisioner::AnsibleProvisioner(const ProvisionConfig& config, CommandRunner& runner,
                                       PortProbe& probe, Poller poller)
    : config_(config), runner_(runner), probe_(probe), poller_(std::move(poller)) {
}

std::string AnsibleProvisioner::clientDirectory(const std::string& name) const {
    return (fs::path(config_.clientDir) / name).string();
}

Status AnsibleProvisioner::waitForSsh(const std::string& ip) {
    const int port = config_.sshPort;
    const std::chrono::seconds interval(config_.portWaitIntervalSec);
    Logger::info("Waiting for SSH on " + ip + ":" + std::to_string(port));
    return poller_.waitUntil(
        [&]() { return probe_.isOpen(ip, port, std::chrono::milliseconds(2000)); },
        interval, config_.portWaitAttempts, "port " + std::to_string(port) + " on " + ip);
}

Status AnsibleProvisioner::writeClientFiles(const std::string& ip, const std::string& name,
                                            const ExtraVars& extraVars) {
    fs::path dir = clientDirectory(name);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        Logger::error("Failed to create " + dir.string() + ": " + ec.message());
        return makeError(ErrorKind::TransportFailure, "Failed to create " + dir.string() + ": " + ec.message());
    }

    nlohmann::json inventory;
    inventory["all"]["hosts"][name]["ansible_host"] = ip;
    Status written = writeJson(dir / "inventory.json", inventory);
    if (written.isErr()) {
        return written;
    }

    nlohmann::json vars = nlohmann::json::object();
    for (const auto& entry : extraVars) {
        vars[entry.first] = entry.second;
    }
    return writeJson(dir / "extravars.json", vars);
}

Status AnsibleProvisioner::run(const std::string& ip, const std::string& name,
                               const std::string& playbook, const ExtraVars& extraVars) {
    if (ip.empty()) {
        return makeError(ErrorKind::NotFound, "No address to provision " + name + " on");
    }

    Status reachable = waitForSsh(ip);
    if (reachable.isErr()) {
        Logger::error(name + " is not reachable over SSH: " + reachable.message());
        return reachable;
    }

    Status prepared = writeClientFiles(ip, name, extraVars);
    if (prepared.isErr()) {
        return prepared;
    }

    fs::path dir = clientDirectory(name);
    std::vector<std::string> args = {"-i", (dir / "inventory.json").string(), "-u", config_.remoteUser};
    if (!config_.privateKey.empty()) {
        args.push_back("--private-key");
        args.push_back(config_.privateKey);
    }
    args.push_back("-e");
    args.push_back("@" + (dir / "extravars.json").string());
    args.push_back((fs::path(config_.playbookDir) / playbook).string());

    Logger::info("Running playbook " + playbook + " on " + name + " (" + ip + ")");
    ExecResult result = runner_.run(config_.ansiblePlaybookPath, args);
    Logger::debug(result.stdoutOutput);
    if (!result.succeeded()) {
        Logger::error("Command: " + formatCommand(config_.ansiblePlaybookPath, args) + "\nExit Code: " +
                      std::to_string(result.exitCode) + "\nError: " + result.stderrOutput);
        return makeError(ErrorKind::TransportFailure,
                         "Playbook " + playbook + " failed on " + name + " with exit code " +
                             std::to_string(result.exitCode));
    }
    Logger::success("Playbook " + playbook + " completed on " + name);
    return Status::ok();
}

Status AnsibleProvisioner::removeClient(const std::string& name) {
    std::string dir = clientDirectory(name);
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        Logger::error("Failed to remove client directory " + dir + ": " + ec.message());
        return makeError(ErrorKind::TransportFailure, "Failed to remove " + dir + ": " + ec.message());
    }
    return Status::ok();
}
