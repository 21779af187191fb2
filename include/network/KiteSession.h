#pragma once

#include "network/IHttpClient.h"
#include <filesystem>
#include <string>

namespace daypilot {
namespace network {

struct KiteCredentials {
    std::string api_key;
    std::filesystem::path token_file;   // access token provisioned out of band
};

// First line of token_file, trimmed. Throws ConfigError when missing or empty.
std::string readAccessToken(const std::filesystem::path& token_file);

// Installs the X-Kite-Version and Authorization headers on client.
// Throws ConfigError without an API key or token.
void authorizeKiteClient(IHttpClient& client, const KiteCredentials& credentials);

// Unwraps {"status": "success", "data": ...}. Anything else throws ExternalCallError.
nlohmann::json parseKiteEnvelope(const HttpResponse& response, const std::string& what);

} // namespace network
} // namespace daypilot
