#include "retry_http/Backoff.hpp"
#include "retry_http/Transport.hpp"

#include <algorithm>
#include <limits>

namespace retry_http {
namespace retry {

std::chrono::milliseconds sleepTime(uint32_t attempt, std::chrono::milliseconds retryTime, int64_t jitterMs) {
	const int64_t cap = kMaxSleepTime.count();
	const int64_t base = std::max<int64_t>(0, retryTime.count());

	int64_t delay;
	if (base == 0) {
		delay = 0;
	} else if (attempt >= 62 || base > (cap >> std::min<uint32_t>(attempt, 62))) {
		delay = cap;
	} else {
		delay = std::min(cap, base << attempt);
	}

	delay -= std::max<int64_t>(0, jitterMs);
	return std::chrono::milliseconds(std::clamp<int64_t>(delay, 0, cap));
}

std::chrono::milliseconds sleepTime(uint32_t attempt, std::chrono::milliseconds retryTime) {
	return sleepTime(attempt, retryTime, util::jitter_generator(kJitterMinMs, kJitterMaxMs));
}

Result backoff(const Context& ctx, uint32_t maxRetries, std::chrono::milliseconds retryTime,
			   const SendFn& send, Transport& transport, HttpRequest& request, Result first) {
	Result last = std::move(first);

	for (uint32_t retries = 1; retries <= maxRetries; ++retries) {
		// First of: context done or sleep over
		if (auto ec = ctx.sleepFor(sleepTime(retries, retryTime)))
			return Result::fromError(ec);

		last = send(ctx, transport, request);

		// Cancellation takes priority over the attempt's own outcome
		if (auto ec = ctx.err())
			return Result::fromError(ec);
		if (!wantRetry(last))
			return last;
	}
	return last;
}

} // namespace retry
} // namespace retry_http
