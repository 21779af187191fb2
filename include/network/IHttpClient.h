#pragma once

#include <string>
#include <map>
#include <nlohmann/json.hpp>

namespace daypilot {
namespace network {

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;

    bool isSuccess() const { return status_code >= 200 && status_code < 300; }
    bool isRateLimited() const { return status_code == 429; }

    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }
};

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual HttpResponse get(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params = {}
    ) = 0;

    // application/x-www-form-urlencoded body
    virtual HttpResponse postForm(
        const std::string& endpoint,
        const std::map<std::string, std::string>& form
    ) = 0;

    virtual HttpResponse putForm(
        const std::string& endpoint,
        const std::map<std::string, std::string>& form
    ) = 0;

    virtual HttpResponse del(const std::string& endpoint) = 0;

    // Sent with every request, e.g. Authorization
    virtual void setDefaultHeader(const std::string& key, const std::string& value) = 0;
};

} // namespace network
} // namespace daypilot
