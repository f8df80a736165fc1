#pragma once

#include <deque>
#include <string>
#include <vector>
#include "backend/gcp/http_transport.hpp"

// Answers requests from a queue of responses; an empty queue gives 200 with "{}".
class FakeHttpTransport : public HttpTransport {
public:
    std::vector<HttpRequest> requests;
    std::deque<Result<HttpResponse>> responses;

    void respond(long status, const std::string& body) {
        HttpResponse response;
        response.status = status;
        response.body = body;
        responses.push_back(response);
    }

    void fail(const std::string& message) {
        responses.push_back(makeError(ErrorKind::TransportFailure, message));
    }

    Result<HttpResponse> send(const HttpRequest& request) override {
        requests.push_back(request);
        if (responses.empty()) {
            HttpResponse ok;
            ok.status = 200;
            ok.body = "{}";
            return ok;
        }
        Result<HttpResponse> next = responses.front();
        responses.pop_front();
        return next;
    }
};
