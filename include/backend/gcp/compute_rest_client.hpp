#pragma once

#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "backend/gcp/compute_api.hpp"
#include "backend/gcp/http_transport.hpp"
#include "common/controller_config.hpp"

class ComputeRestClient : public ComputeApi {
public:
    // A libcurl transport is created when none is given.
    ComputeRestClient(const GcpConfig& config, std::string accessToken,
                      std::unique_ptr<HttpTransport> transport = nullptr);

    Result<nlohmann::json> getInstance(const std::string& instance) override;
    Result<nlohmann::json> listInstances() override;
    Result<nlohmann::json> deleteInstance(const std::string& instance) override;
    Result<nlohmann::json> startInstance(const std::string& instance) override;
    Result<nlohmann::json> stopInstance(const std::string& instance) override;
    Result<nlohmann::json> resetInstance(const std::string& instance) override;
    Result<nlohmann::json> attachDisk(const std::string& instance, const nlohmann::json& attachedDisk) override;
    Result<nlohmann::json> detachDisk(const std::string& instance, const std::string& deviceName) override;

    Result<nlohmann::json> insertDisk(const nlohmann::json& disk) override;
    Result<nlohmann::json> getDisk(const std::string& disk) override;
    Result<nlohmann::json> resizeDisk(const std::string& disk, int64_t sizeGb) override;
    Result<nlohmann::json> deleteDisk(const std::string& disk) override;

    Result<nlohmann::json> getZoneOperation(const std::string& operation) override;
    Result<nlohmann::json> getGlobalOperation(const std::string& operation) override;

    std::string diskSource(const std::string& disk) const override;

private:
    Result<nlohmann::json> makeRequest(const std::string& method, const std::string& path,
                                       const nlohmann::json& data = nlohmann::json());
    std::string zonePath() const;
    std::string buildUrl(const std::string& path) const;
    // Pulls error.message out of an API error body, falling back to the raw text.
    static std::string apiErrorMessage(const std::string& body);

    GcpConfig config_;
    std::string accessToken_;
    std::unique_ptr<HttpTransport> transport_;
};
