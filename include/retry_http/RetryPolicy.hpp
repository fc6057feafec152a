#pragma once

#include "Context.hpp"
#include "models.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace retry_http {

class Transport;

/**
 * Sends one attempt of a request through a transport.
 * Receives the request mutably so the body can be re-obtained before each send.
 */
using SendFn = std::function<Result(const Context&, Transport&, HttpRequest&)>;

/**
 * Configuration for retry behavior.
 * Fixed once a client is constructed.
 */
struct RetryPolicy {
    uint32_t maxRetries = 10;                           // Retries after the first attempt, 0 disables retry
    std::chrono::milliseconds retryTime{20};            // Base delay, doubled on every retry
    std::set<std::string> pathsWithNoRetries;           // Exact URL paths that are never retried

    bool retriesPath(const std::string& path) const {
        return this->maxRetries > 0 && this->pathsWithNoRetries.count(path) == 0;
    }
};

namespace retry {

constexpr long kStatusConflict = 409;
constexpr long kStatusInternalServerError = 500;

/**
 * Whether an attempt outcome warrants another attempt.
 * Transport errors, 5xx and 409 are retried. Everything else is final,
 * 429 included.
 */
inline bool wantRetry(const std::error_code& error, const HttpResponse* response) {
    if (error || !response)
        return true;
    return response->status >= kStatusInternalServerError || response->status == kStatusConflict;
}

inline bool wantRetry(const Result& result) {
    return wantRetry(result.error, result.response ? &*result.response : nullptr);
}

} // namespace retry

} // namespace retry_http
