#pragma once

#include <deque>
#include <map>
#include <string>
#include <vector>
#include "backend/gcp/compute_api.hpp"

// Serves instances and disks from maps. Mutations return an operation named
// op-<n>; getZoneOperation replays the statuses queued in operationStatuses
// (then DONE), attaching operationError to the DONE response when set.
class FakeComputeApi : public ComputeApi {
public:
    std::map<std::string, nlohmann::json> instances;
    std::map<std::string, nlohmann::json> disks;

    std::deque<std::string> operationStatuses;
    std::string operationError;
    bool failOperationFetch = false;

    std::vector<std::string> calls;
    std::vector<nlohmann::json> bodies;
    int operationFetches = 0;

    Result<nlohmann::json> getInstance(const std::string& instance) override {
        auto it = instances.find(instance);
        if (it == instances.end()) {
            return makeError(ErrorKind::NotFound, "The resource '" + instance + "' was not found");
        }
        return it->second;
    }

    Result<nlohmann::json> listInstances() override {
        nlohmann::json items = nlohmann::json::array();
        for (const auto& instance : instances) {
            items.push_back(instance.second);
        }
        return items;
    }

    Result<nlohmann::json> deleteInstance(const std::string& instance) override {
        return mutation("deleteInstance:" + instance);
    }
    Result<nlohmann::json> startInstance(const std::string& instance) override {
        return mutation("startInstance:" + instance);
    }
    Result<nlohmann::json> stopInstance(const std::string& instance) override {
        return mutation("stopInstance:" + instance);
    }
    Result<nlohmann::json> resetInstance(const std::string& instance) override {
        return mutation("resetInstance:" + instance);
    }
    Result<nlohmann::json> attachDisk(const std::string& instance, const nlohmann::json& attachedDisk) override {
        bodies.push_back(attachedDisk);
        return mutation("attachDisk:" + instance);
    }
    Result<nlohmann::json> detachDisk(const std::string& instance, const std::string& deviceName) override {
        return mutation("detachDisk:" + instance + ":" + deviceName);
    }

    Result<nlohmann::json> insertDisk(const nlohmann::json& disk) override {
        bodies.push_back(disk);
        return mutation("insertDisk:" + disk.value("name", std::string()));
    }
    Result<nlohmann::json> getDisk(const std::string& disk) override {
        auto it = disks.find(disk);
        if (it == disks.end()) {
            return makeError(ErrorKind::NotFound, "disk " + disk);
        }
        return it->second;
    }
    Result<nlohmann::json> resizeDisk(const std::string& disk, int64_t sizeGb) override {
        return mutation("resizeDisk:" + disk + ":" + std::to_string(sizeGb));
    }
    Result<nlohmann::json> deleteDisk(const std::string& disk) override {
        return mutation("deleteDisk:" + disk);
    }

    Result<nlohmann::json> getZoneOperation(const std::string& operation) override {
        ++operationFetches;
        if (failOperationFetch) {
            return makeError(ErrorKind::TransportFailure, "connection reset");
        }
        nlohmann::json op = {{"name", operation}, {"status", "DONE"}};
        if (!operationStatuses.empty()) {
            op["status"] = operationStatuses.front();
            operationStatuses.pop_front();
        }
        if (op["status"] == "DONE" && !operationError.empty()) {
            nlohmann::json entry = {{"code", "RESOURCE_NOT_READY"}, {"message", operationError}};
            op["error"] = {{"errors", nlohmann::json::array({entry})}};
        }
        return op;
    }
    Result<nlohmann::json> getGlobalOperation(const std::string& operation) override {
        return getZoneOperation(operation);
    }

    std::string diskSource(const std::string& disk) const override {
        return "projects/demo/zones/us-central1-a/disks/" + disk;
    }

private:
    Result<nlohmann::json> mutation(const std::string& call) {
        calls.push_back(call);
        return nlohmann::json{{"name", "op-" + std::to_string(calls.size())}, {"status", "RUNNING"}};
    }
};
