#pragma once

#include "network/IHttpClient.h"
#include <curl/curl.h>
#include <mutex>

namespace daypilot {
namespace network {

// libcurl client bound to one base URL. Transport failures throw
// ExternalCallError; HTTP error statuses are returned to the caller.
class HttpClient : public IHttpClient {
public:
    explicit HttpClient(std::string base_url, long timeout_seconds = 30);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse get(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params = {}
    ) override;

    HttpResponse postForm(
        const std::string& endpoint,
        const std::map<std::string, std::string>& form
    ) override;

    HttpResponse putForm(
        const std::string& endpoint,
        const std::map<std::string, std::string>& form
    ) override;

    HttpResponse del(const std::string& endpoint) override;

    void setDefaultHeader(const std::string& key, const std::string& value) override;

    const std::string& baseUrl() const { return base_url_; }

private:
    std::string base_url_;
    long timeout_seconds_;
    CURL* curl_;
    std::mutex mutex_;
    std::map<std::string, std::string> default_headers_;

    HttpResponse performRequest(
        const std::string& method,
        const std::string& url,
        const std::string& body_data,
        const std::map<std::string, std::string>& headers
    );

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);

    std::string buildQueryString(const std::map<std::string, std::string>& params);
};

} // namespace network
} // namespace daypilot
