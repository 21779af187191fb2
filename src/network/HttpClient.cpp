#include "network/HttpClient.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <sstream>

namespace daypilot {
namespace network {

HttpClient::HttpClient(std::string base_url, long timeout_seconds)
    : base_url_(std::move(base_url))
    , timeout_seconds_(timeout_seconds)
    , curl_(nullptr)
{
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }

    curl_global_init(CURL_GLOBAL_ALL);
    curl_ = curl_easy_init();

    if (!curl_) {
        throw ExternalCallError("Failed to initialize CURL");
    }
}

HttpClient::~HttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
    curl_global_cleanup();
}

void HttpClient::setDefaultHeader(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    default_headers_[key] = value;
}

HttpResponse HttpClient::get(
    const std::string& endpoint,
    const std::map<std::string, std::string>& query_params
) {
    std::string url = base_url_ + endpoint;
    if (!query_params.empty()) {
        url += "?" + buildQueryString(query_params);
    }
    return performRequest("GET", url, "", {});
}

HttpResponse HttpClient::postForm(
    const std::string& endpoint,
    const std::map<std::string, std::string>& form
) {
    std::map<std::string, std::string> headers;
    headers["Content-Type"] = "application/x-www-form-urlencoded";
    return performRequest("POST", base_url_ + endpoint, buildQueryString(form), headers);
}

HttpResponse HttpClient::putForm(
    const std::string& endpoint,
    const std::map<std::string, std::string>& form
) {
    std::map<std::string, std::string> headers;
    headers["Content-Type"] = "application/x-www-form-urlencoded";
    return performRequest("PUT", base_url_ + endpoint, buildQueryString(form), headers);
}

HttpResponse HttpClient::del(const std::string& endpoint) {
    return performRequest("DELETE", base_url_ + endpoint, "", {});
}

HttpResponse HttpClient::performRequest(
    const std::string& method,
    const std::string& url,
    const std::string& body_data,
    const std::map<std::string, std::string>& headers
) {
    std::lock_guard<std::mutex> lock(mutex_);

    HttpResponse response;
    std::string response_body;
    std::map<std::string, std::string> response_headers;

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response_headers);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    if (method == "POST") {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body_data.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body_data.size()));
    } else if (method == "PUT") {
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, "PUT");
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body_data.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body_data.size()));
    } else if (method == "DELETE") {
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, "DELETE");
    }

    std::map<std::string, std::string> all_headers = default_headers_;
    for (const auto& [key, value] : headers) {
        all_headers[key] = value;
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : all_headers) {
        std::string header_line = key + ": " + value;
        header_list = curl_slist_append(header_list, header_line.c_str());
    }
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);

    CURLcode res = curl_easy_perform(curl_);

    if (res != CURLE_OK) {
        curl_slist_free_all(header_list);
        throw ExternalCallError(method + " " + url + " failed: " + curl_easy_strerror(res));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(header_list);

    response.status_code = static_cast<int>(http_code);
    response.body = response_body;
    response.headers = response_headers;

    if (!response.isSuccess()) {
        LOG_DEBUG("{} {} -> HTTP {}", method, url, response.status_code);
    }
    return response;
}

size_t HttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* response_body = static_cast<std::string*>(userp);
    response_body->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t HttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    std::string header_line(buffer, total_size);

    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string key = header_line.substr(0, colon_pos);
        std::string value = header_line.substr(colon_pos + 1);

        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
        (*headers)[key] = value;
    }

    return total_size;
}

std::string HttpClient::buildQueryString(const std::map<std::string, std::string>& params) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        char* escaped = curl_easy_escape(curl_, value.c_str(), static_cast<int>(value.size()));
        oss << key << "=" << (escaped ? escaped : "");
        if (escaped) curl_free(escaped);
        first = false;
    }
    return oss.str();
}

} // namespace network
} // namespace daypilot
