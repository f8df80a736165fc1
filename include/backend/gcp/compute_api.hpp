#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "common/result.hpp"

/**
 * ComputeApi - the subset of the Compute Engine v1 API the controller uses.
 *
 * Mutating calls return the Operation resource the service created; callers
 * poll it to completion with OperationPoller. All resources are scoped to the
 * project and zone the implementation was built for.
 */
class ComputeApi {
public:
    virtual ~ComputeApi() = default;

    // Instances
    virtual Result<nlohmann::json> getInstance(const std::string& instance) = 0;
    // All pages merged into one array of instance resources.
    virtual Result<nlohmann::json> listInstances() = 0;
    virtual Result<nlohmann::json> deleteInstance(const std::string& instance) = 0;
    virtual Result<nlohmann::json> startInstance(const std::string& instance) = 0;
    virtual Result<nlohmann::json> stopInstance(const std::string& instance) = 0;
    virtual Result<nlohmann::json> resetInstance(const std::string& instance) = 0;
    virtual Result<nlohmann::json> attachDisk(const std::string& instance, const nlohmann::json& attachedDisk) = 0;
    virtual Result<nlohmann::json> detachDisk(const std::string& instance, const std::string& deviceName) = 0;

    // Disks
    virtual Result<nlohmann::json> insertDisk(const nlohmann::json& disk) = 0;
    virtual Result<nlohmann::json> getDisk(const std::string& disk) = 0;
    virtual Result<nlohmann::json> resizeDisk(const std::string& disk, int64_t sizeGb) = 0;
    virtual Result<nlohmann::json> deleteDisk(const std::string& disk) = 0;

    // Operations
    virtual Result<nlohmann::json> getZoneOperation(const std::string& operation) = 0;
    virtual Result<nlohmann::json> getGlobalOperation(const std::string& operation) = 0;

    // Partial resource URL of a zonal disk, as attachDisk expects it in "source".
    virtual std::string diskSource(const std::string& disk) const = 0;
};
