#include "network/KiteSession.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <fstream>

namespace daypilot {
namespace network {

std::string readAccessToken(const std::filesystem::path& token_file) {
    std::ifstream in(token_file);
    if (!in.is_open()) {
        throw ConfigError("access token file not found: " + token_file.string());
    }
    std::string token;
    std::getline(in, token);
    token.erase(0, token.find_first_not_of(" \t\r\n"));
    token.erase(token.find_last_not_of(" \t\r\n") + 1);
    if (token.empty()) {
        throw ConfigError("access token file is empty: " + token_file.string());
    }
    return token;
}

void authorizeKiteClient(IHttpClient& client, const KiteCredentials& credentials) {
    if (credentials.api_key.empty()) {
        throw ConfigError("DAYPILOT_API_KEY is required for the Kite API");
    }
    const std::string token = readAccessToken(credentials.token_file);
    client.setDefaultHeader("X-Kite-Version", "3");
    client.setDefaultHeader("Authorization", "token " + credentials.api_key + ":" + token);
    LOG_INFO("Reused access token from {}", credentials.token_file.string());
}

nlohmann::json parseKiteEnvelope(const HttpResponse& response, const std::string& what) {
    nlohmann::json body;
    try {
        body = response.json();
    } catch (const nlohmann::json::exception&) {
        throw ExternalCallError(what + " failed: HTTP " + std::to_string(response.status_code));
    }
    if (!response.isSuccess() || !body.is_object() || body.value("status", std::string()) != "success") {
        const std::string message = body.is_object()
            ? body.value("message", std::string("unknown error"))
            : std::string("unexpected response");
        throw ExternalCallError(what + " failed: HTTP " + std::to_string(response.status_code) + " " + message);
    }
    return body.value("data", nlohmann::json::object());
}

} // namespace network
} // namespace daypilot
