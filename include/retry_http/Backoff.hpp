#pragma once

#include "Context.hpp"
#include "RetryPolicy.hpp"
#include "models.hpp"

#include <chrono>
#include <cstdint>

namespace retry_http {

class Transport;

namespace retry {

// Jitter subtracted from every backoff delay, in milliseconds
constexpr int64_t kJitterMinMs = 1;
constexpr int64_t kJitterMaxMs = 4;

// Upper bound on a single backoff delay
constexpr std::chrono::milliseconds kMaxSleepTime = std::chrono::hours(24);

/**
 * Delay before retry `attempt` (1-based): 2^attempt * retryTime - jitterMs,
 * clamped to [0, kMaxSleepTime].
 */
std::chrono::milliseconds sleepTime(uint32_t attempt, std::chrono::milliseconds retryTime, int64_t jitterMs);

/**
 * Same as above with jitter drawn uniformly from [kJitterMinMs, kJitterMaxMs].
 */
std::chrono::milliseconds sleepTime(uint32_t attempt, std::chrono::milliseconds retryTime);

/**
 * Runs retries 1..maxRetries for a request whose first attempt was retryable.
 *
 * Each round sleeps for sleepTime(n), aborting with the context error if the
 * context finishes first, then sends again. A cancellation observed after the
 * send wins over whatever the send produced. The loop ends on the first
 * outcome wantRetry() rejects, or returns the last outcome once maxRetries is
 * reached. `first` is the outcome of the initial attempt and is returned
 * as-is when no retry runs.
 */
Result backoff(const Context& ctx, uint32_t maxRetries, std::chrono::milliseconds retryTime,
               const SendFn& send, Transport& transport, HttpRequest& request, Result first);

} // namespace retry

} // namespace retry_http
