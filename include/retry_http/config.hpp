#pragma once

#include "RetryPolicy.hpp"
#include "Transport.hpp"
#include "logger.hpp"
#include "models.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace retry_http {

/**
 * Everything a client needs, held by value. Defaults: 10 retries, 20ms base
 * delay, no exempt paths, 10s per-attempt timeout, 5s connect timeout.
 * The with* helpers return modified copies.
 */
struct ClientConfig {
	RetryPolicy retry;
	RequestPolicy request;
	TransportSettings transport;

	ClientConfig withTimeout(std::chrono::milliseconds timeout) const;
	ClientConfig withMaxRetries(uint32_t maxRetries) const;
	ClientConfig withRetryTime(std::chrono::milliseconds retryTime) const;
	ClientConfig withPathsWithNoRetries(const std::vector<std::string>& paths) const;
};

/**
 * Overrides defaults from RETRY_HTTP_MAX_RETRIES, RETRY_HTTP_RETRY_TIME_MS,
 * RETRY_HTTP_TIMEOUT_MS, RETRY_HTTP_CONNECT_TIMEOUT_MS and
 * RETRY_HTTP_NO_RETRY_PATHS (comma separated). RETRY_HTTP_LOG_LEVEL sets the
 * process logger level.
 * @throws std::invalid_argument when a numeric variable does not parse.
 */
ClientConfig loadConfigFromEnv(ClientConfig base = ClientConfig());

// Parses "trace", "debug", "info", "warn", "error" or "off"; falls back to `def`
LogLevel parseLogLevel(const std::string& name, LogLevel def);

} // namespace retry_http
