#pragma once

#include "common/Errors.h"
#include "common/Logger.h"

#include <chrono>
#include <cmath>
#include <exception>
#include <functional>
#include <string>

namespace daypilot {

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Calls fn up to `attempts` times, sleeping base^attempt seconds between
// failures. The last failure is rethrown unchanged.
template <typename Fn>
auto retryWithBackoff(Fn&& fn, int attempts, double base_seconds, const Sleeper& sleeper,
                      const std::string& what) -> decltype(fn()) {
    std::exception_ptr last_error;
    for (int attempt = 0; attempt < attempts; ++attempt) {
        try {
            return fn();
        } catch (const std::exception& e) {
            last_error = std::current_exception();
            LOG_WARN("{} retry {}/{} failed: {}", what, attempt + 1, attempts, e.what());
        }
        if (attempt + 1 < attempts && sleeper) {
            const double delay_s = std::pow(base_seconds, attempt);
            sleeper(std::chrono::milliseconds(static_cast<long long>(delay_s * 1000.0)));
        }
    }
    LOG_ERROR("{}: all {} retry attempts failed", what, attempts);
    if (last_error) {
        std::rethrow_exception(last_error);
    }
    throw ExternalCallError(what + ": no attempt made");
}

} // namespace daypilot
