#include "backend/gcp/compute_rest_client.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"

ComputeRestClient::ComputeRestClient(const GcpConfig& config, std::string accessToken,
                                     std::unique_ptr<HttpTransport> transport)
    : config_(config), accessToken_(std::move(accessToken)), transport_(std::move(transport)) {
    Logger::debug("Initializing ComputeRestClient for project " + config_.projectId + ", zone " + config_.zone);
    if (!transport_) {
        transport_ = std::make_unique<CurlTransport>(config_.requestTimeoutSec);
    }
}

std::string ComputeRestClient::zonePath() const {
    return "/projects/" + utils::urlEncode(config_.projectId) + "/zones/" + utils::urlEncode(config_.zone);
}

std::string ComputeRestClient::buildUrl(const std::string& path) const {
    std::string base = config_.apiEndpoint;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + path;
}

std::string ComputeRestClient::diskSource(const std::string& disk) const {
    return "projects/" + config_.projectId + "/zones/" + config_.zone + "/disks/" + disk;
}

std::string ComputeRestClient::apiErrorMessage(const std::string& body) {
    nlohmann::json parsed = nlohmann::json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("error")) {
        const auto& error = parsed["error"];
        if (error.is_object() && error.contains("message") && error["message"].is_string()) {
            return error["message"].get<std::string>();
        }
    }
    return body;
}

Result<nlohmann::json> ComputeRestClient::makeRequest(const std::string& method, const std::string& path,
                                                      const nlohmann::json& data) {
    HttpRequest request;
    request.method = method;
    request.url = buildUrl(path);
    request.headers = {"Content-Type: application/json",
                       "Accept: application/json",
                       "Authorization: Bearer " + accessToken_};
    Logger::debug("Making " + method + " request to: " + request.url);

    if (method == "POST") {
        request.body = data.is_null() ? std::string() : data.dump();
        Logger::debug("Request body: " + request.body);
    }

    auto sent = transport_->send(request);
    if (sent.isErr()) {
        return sent.unwrapErr();
    }
    const HttpResponse& response = sent.unwrap();
    Logger::debug("Response code: " + std::to_string(response.status));

    if (response.status == 404) {
        return makeError(ErrorKind::NotFound, apiErrorMessage(response.body));
    }
    if (response.status < 200 || response.status >= 300) {
        std::string message = apiErrorMessage(response.body);
        Logger::error("Request failed with status code " + std::to_string(response.status) + ": " + message);
        return makeError(ErrorKind::TransportFailure,
                         method + " " + path + " returned " + std::to_string(response.status) + ": " + message);
    }

    if (response.body.empty()) {
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::exception& e) {
        Logger::error("Failed to parse response: " + std::string(e.what()));
        return makeError(ErrorKind::ParseError, "Malformed response from " + path + ": " + e.what());
    }
}

Result<nlohmann::json> ComputeRestClient::getInstance(const std::string& instance) {
    return makeRequest("GET", zonePath() + "/instances/" + utils::urlEncode(instance));
}

Result<nlohmann::json> ComputeRestClient::listInstances() {
    nlohmann::json instances = nlohmann::json::array();
    std::string pageToken;
    do {
        std::string path = zonePath() + "/instances";
        if (!pageToken.empty()) {
            path += "?pageToken=" + utils::urlEncode(pageToken);
        }
        auto page = makeRequest("GET", path);
        if (page.isErr()) {
            return page;
        }
        const auto& body = page.unwrap();
        if (body.contains("items") && body["items"].is_array()) {
            for (const auto& item : body["items"]) {
                instances.push_back(item);
            }
        }
        pageToken = body.value("nextPageToken", std::string());
    } while (!pageToken.empty());
    return instances;
}

Result<nlohmann::json> ComputeRestClient::deleteInstance(const std::string& instance) {
    return makeRequest("DELETE", zonePath() + "/instances/" + utils::urlEncode(instance));
}

Result<nlohmann::json> ComputeRestClient::startInstance(const std::string& instance) {
    return makeRequest("POST", zonePath() + "/instances/" + utils::urlEncode(instance) + "/start");
}

Result<nlohmann::json> ComputeRestClient::stopInstance(const std::string& instance) {
    return makeRequest("POST", zonePath() + "/instances/" + utils::urlEncode(instance) + "/stop");
}

Result<nlohmann::json> ComputeRestClient::resetInstance(const std::string& instance) {
    return makeRequest("POST", zonePath() + "/instances/" + utils::urlEncode(instance) + "/reset");
}

Result<nlohmann::json> ComputeRestClient::attachDisk(const std::string& instance, const nlohmann::json& attachedDisk) {
    return makeRequest("POST", zonePath() + "/instances/" + utils::urlEncode(instance) + "/attachDisk", attachedDisk);
}

Result<nlohmann::json> ComputeRestClient::detachDisk(const std::string& instance, const std::string& deviceName) {
    return makeRequest("POST", zonePath() + "/instances/" + utils::urlEncode(instance) +
                                   "/detachDisk?deviceName=" + utils::urlEncode(deviceName));
}

Result<nlohmann::json> ComputeRestClient::insertDisk(const nlohmann::json& disk) {
    return makeRequest("POST", zonePath() + "/disks", disk);
}

Result<nlohmann::json> ComputeRestClient::getDisk(const std::string& disk) {
    return makeRequest("GET", zonePath() + "/disks/" + utils::urlEncode(disk));
}

Result<nlohmann::json> ComputeRestClient::resizeDisk(const std::string& disk, int64_t sizeGb) {
    nlohmann::json request = {{"sizeGb", std::to_string(sizeGb)}};
    return makeRequest("POST", zonePath() + "/disks/" + utils::urlEncode(disk) + "/resize", request);
}

Result<nlohmann::json> ComputeRestClient::deleteDisk(const std::string& disk) {
    return makeRequest("DELETE", zonePath() + "/disks/" + utils::urlEncode(disk));
}

Result<nlohmann::json> ComputeRestClient::getZoneOperation(const std::string& operation) {
    return makeRequest("GET", zonePath() + "/operations/" + utils::urlEncode(operation));
}

Result<nlohmann::json> ComputeRestClient::getGlobalOperation(const std::string& operation) {
    return makeRequest("GET", "/projects/" + utils::urlEncode(config_.projectId) + "/global/operations/" +
                                  utils::urlEncode(operation));
}
