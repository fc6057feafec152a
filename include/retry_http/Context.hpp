#pragma once

#include "errors.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace retry_http {

namespace detail {
struct ContextState;
}

/**
 * Cancellation signal with an optional deadline and request-scoped values.
 *
 * A Context is a cheap handle; copies share the same state. Once done it stays
 * done, and err() keeps returning the first reason recorded (canceled or
 * deadline exceeded). Cancelling a parent cancels every context derived from it.
 */
class Context {
public:
	using Clock = std::chrono::steady_clock;
	using CancelFunc = std::function<void()>;
	using CallbackId = uint64_t;

	// Never cancelled, no deadline, no values
	static Context background();

	static std::pair<Context, CancelFunc> withCancel(const Context& parent);
	static std::pair<Context, CancelFunc> withDeadline(const Context& parent, Clock::time_point deadline);
	static std::pair<Context, CancelFunc> withTimeout(const Context& parent, Clock::duration timeout);
	static Context withValue(const Context& parent, std::string key, std::string value);

	bool done() const;
	std::error_code err() const;
	std::optional<Clock::time_point> deadline() const;
	std::optional<std::string> value(const std::string& key) const;

	/**
	 * Blocks until `duration` elapses or the context is done, whichever comes first.
	 * Returns err() if the context finished first, an empty error code otherwise.
	 */
	std::error_code sleepFor(Clock::duration duration) const;

	/**
	 * Registers a callback invoked once when the context is cancelled.
	 * If the context is already cancelled the callback runs immediately.
	 * Deadline expiry is only observed lazily (done(), err(), sleepFor()).
	 */
	CallbackId onCancel(std::function<void()> callback) const;
	void removeCallback(CallbackId id) const;

private:
	explicit Context(std::shared_ptr<detail::ContextState> state);

	std::shared_ptr<detail::ContextState> state_;
};

/**
 * Removes a Context callback when it goes out of scope.
 */
class ScopedCancelCallback {
public:
	ScopedCancelCallback(const Context& ctx, std::function<void()> callback)
		: ctx_(ctx), id_(ctx.onCancel(std::move(callback))) {}
	~ScopedCancelCallback() { this->ctx_.removeCallback(this->id_); }

	ScopedCancelCallback(const ScopedCancelCallback&) = delete;
	ScopedCancelCallback& operator=(const ScopedCancelCallback&) = delete;

private:
	Context ctx_;
	Context::CallbackId id_;
};

} // namespace retry_http
