#pragma once

#include "Context.hpp"
#include "models.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace retry_http {

// Wire names
constexpr const char* kRequestIdHeader = "X-Request-Id";
constexpr const char* kUserIdentityHeader = "User-Identity";

// Context value keys
constexpr const char* kRequestIdKey = "request-id";
constexpr const char* kUserIdentityKey = "user-identity";

constexpr size_t kDefaultRequestIdLength = 20;

/**
 * Random identifier of `length` characters from [a-zA-Z0-9].
 * Throws std::runtime_error if the OpenSSL RNG fails.
 */
std::string newRequestId(size_t length);

/**
 * Correlation chain for an outgoing request.
 *
 * Without an upstream chain this is a fresh 20 character id. Otherwise a new id
 * is appended after a comma, half as long as the first upstream segment
 * (half the whole chain when it has no comma, or a comma at position 0 or 1).
 */
std::string buildRequestId(std::string_view upstream);

// Context helpers
Context withRequestId(const Context& ctx, std::string requestId);
std::string getRequestId(const Context& ctx);
Context withUser(const Context& ctx, std::string user);
std::string getUser(const Context& ctx);

/**
 * Sets X-Request-Id from the context's chain, and User-Identity from the
 * context's user unless the request already carries one.
 */
void addCorrelationHeaders(const Context& ctx, HttpRequest& request);

} // namespace retry_http
