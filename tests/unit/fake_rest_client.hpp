#pragma once
// ============================================================================
// SPICEDECK - Scripted REST client for tests
// ============================================================================

#include "spicedeck/network/rest_client.hpp"

#include <map>
#include <string>
#include <vector>

namespace spicedeck::test_support {

class FakeRestClient : public network::IRestClient {
public:
    void respond(const std::string& url, int status, std::string body, std::string reason = "") {
        network::HttpResponse response;
        response.status_code = status;
        response.reason = reason.empty() ? (status == 200 ? "OK" : "Error") : std::move(reason);
        response.body = std::move(body);
        responses_[url] = std::move(response);
    }

    network::HttpResponse request(const network::HttpRequest& request) override {
        requested_.push_back(request.url);
        auto it = responses_.find(request.url);
        if (it == responses_.end()) {
            network::HttpResponse missing;
            missing.status_code = 404;
            missing.reason = "Not Found";
            return missing;
        }
        return it->second;
    }

    int get_rate_limit_remaining() const override { return -1; }

    const std::vector<std::string>& requested() const { return requested_; }

private:
    std::map<std::string, network::HttpResponse> responses_;
    std::vector<std::string> requested_;
};

}  // namespace spicedeck::test_support
