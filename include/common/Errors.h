#pragma once

#include <stdexcept>
#include <string>

namespace daypilot {

// Missing or insufficient bars, unparseable timestamps.
// Callers pause and retry instead of evaluating partial data.
class DataError : public std::runtime_error {
public:
    explicit DataError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Broker / HTTP / store failures. Logged and retried, never fatal to the loop.
class ExternalCallError : public std::runtime_error {
public:
    explicit ExternalCallError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace daypilot
