#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>
#include "backend/gcp/compute_api.hpp"
#include "common/poller.hpp"
#include "common/result.hpp"

struct Operation {
    std::string name;
    std::string status;  // PENDING, RUNNING or DONE
    std::string error;   // joined error messages, empty when none

    bool isDone() const { return status == "DONE"; }
    bool hasError() const { return !error.empty(); }

    static Operation fromJson(const nlohmann::json& resource);
};

// Polls a Compute Engine operation until it reaches DONE.
class OperationPoller {
public:
    // timeout of zero polls until the operation finishes, however long that takes.
    OperationPoller(ComputeApi& api, Poller poller,
                    std::chrono::milliseconds interval, std::chrono::seconds timeout);

    // Transport problems fetching the operation end the wait with TransportFailure,
    // a DONE operation carrying errors with OperationError.
    Status waitForZoneOperation(const nlohmann::json& operation);
    Status waitForGlobalOperation(const nlohmann::json& operation);

private:
    Status waitFor(const nlohmann::json& operation, bool global);
    int maxAttempts() const;

    ComputeApi& api_;
    Poller poller_;
    std::chrono::milliseconds interval_;
    std::chrono::seconds timeout_;
};
