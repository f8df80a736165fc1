#pragma once

#include <string>
#include <vector>
#include <curl/curl.h>
#include "common/result.hpp"

struct HttpRequest {
    std::string method;  // GET, POST or DELETE
    std::string url;
    std::vector<std::string> headers;
    std::string body;
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

// One HTTP exchange. Only a failure to get any response is an error;
// status codes are left to the caller.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(int timeoutSec);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    Result<HttpResponse> send(const HttpRequest& request) override;

private:
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp);

    int timeoutSec_;
    CURL* curl_;
};
