#include "backend/gcp/operation_poller.hpp"
#include "common/logger.hpp"
#include <limits>

Operation Operation::fromJson(const nlohmann::json& resource) {
    Operation op;
    if (!resource.is_object()) {
        return op;
    }
    op.name = resource.value("name", std::string());
    op.status = resource.value("status", std::string());

    if (resource.contains("error") && resource["error"].is_object()) {
        const auto& errors = resource["error"].value("errors", nlohmann::json::array());
        for (const auto& entry : errors) {
            std::string message = entry.value("message", entry.value("code", std::string("unknown error")));
            op.error += op.error.empty() ? message : "; " + message;
        }
        if (op.error.empty()) {
            op.error = resource["error"].dump();
        }
    }
    return op;
}

OperationPoller::OperationPoller(ComputeApi& api, Poller poller,
                                 std::chrono::milliseconds interval, std::chrono::seconds timeout)
    : api_(api), poller_(std::move(poller)), interval_(interval), timeout_(timeout) {
    if (interval_.count() <= 0) {
        interval_ = std::chrono::milliseconds(1000);
    }
}

Status OperationPoller::waitForZoneOperation(const nlohmann::json& operation) {
    return waitFor(operation, false);
}

Status OperationPoller::waitForGlobalOperation(const nlohmann::json& operation) {
    return waitFor(operation, true);
}

int OperationPoller::maxAttempts() const {
    if (timeout_.count() <= 0) {
        return Poller::kUnbounded;
    }
    auto timeoutMs = std::chrono::duration_cast<std::chrono::milliseconds>(timeout_).count();
    auto attempts = (timeoutMs + interval_.count() - 1) / interval_.count();
    if (attempts > std::numeric_limits<int>::max()) {
        return std::numeric_limits<int>::max();
    }
    return attempts < 1 ? 1 : static_cast<int>(attempts);
}

Status OperationPoller::waitFor(const nlohmann::json& operation, bool global) {
    Operation op = Operation::fromJson(operation);
    if (op.name.empty()) {
        return makeError(ErrorKind::ParseError, "Operation resource has no name");
    }

    Status outcome = Status::ok();
    auto finished = [&]() {
        auto fetched = global ? api_.getGlobalOperation(op.name) : api_.getZoneOperation(op.name);
        if (fetched.isErr()) {
            Logger::error("Failed to fetch operation " + op.name + ": " + fetched.message());
            outcome = makeError(ErrorKind::TransportFailure,
                                "Failed to fetch operation " + op.name + ": " + fetched.message());
            return true;
        }
        Operation current = Operation::fromJson(fetched.unwrap());
        if (!current.isDone()) {
            return false;
        }
        if (current.hasError()) {
            Logger::error("Operation " + op.name + " failed: " + current.error);
            outcome = makeError(ErrorKind::OperationError, current.error);
        }
        return true;
    };

    Status waited = poller_.waitUntil(finished, interval_, maxAttempts(), "operation " + op.name);
    if (waited.isErr()) {
        Logger::error(waited.message());
        return waited;
    }
    return outcome;
}
