#include "retry_http/Context.hpp"

#include <condition_variable>
#include <mutex>

namespace retry_http {

namespace detail {

struct ContextState {
	using Clock = Context::Clock;

	std::shared_ptr<ContextState> parent;
	uint64_t parentCallbackId = 0;
	bool neverCancels = false;

	std::optional<Clock::time_point> deadline;
	std::optional<std::pair<std::string, std::string>> value;

	std::mutex mutex;
	std::condition_variable cv;
	std::error_code err;
	uint64_t nextId = 1;
	std::map<uint64_t, std::function<void()>> callbacks;

	~ContextState() {
		if (this->parent && this->parentCallbackId)
			this->parent->removeCallback(this->parentCallbackId);
	}

	std::error_code error() {
		std::lock_guard<std::mutex> lk(this->mutex);
		return this->err;
	}

	void cancel(std::error_code reason) {
		std::map<uint64_t, std::function<void()>> toRun;
		{
			std::lock_guard<std::mutex> lk(this->mutex);
			if (this->err)
				return;
			this->err = reason;
			toRun.swap(this->callbacks);
		}
		this->cv.notify_all();
		for (auto& entry : toRun)
			entry.second();
	}

	// Latches deadline expiry into the error state
	void checkDeadline() {
		if (this->deadline && Clock::now() >= *this->deadline)
			this->cancel(make_error_code(context_errc::deadline_exceeded));
	}

	uint64_t addCallback(std::function<void()> callback) {
		{
			std::lock_guard<std::mutex> lk(this->mutex);
			if (!this->err) {
				uint64_t id = this->nextId++;
				this->callbacks.emplace(id, std::move(callback));
				return id;
			}
		}
		callback();
		return 0;
	}

	void removeCallback(uint64_t id) {
		if (id == 0)
			return;
		std::lock_guard<std::mutex> lk(this->mutex);
		this->callbacks.erase(id);
	}
};

} // namespace detail

using detail::ContextState;

namespace {

std::shared_ptr<ContextState> derive(const std::shared_ptr<ContextState>& parent) {
	auto child = std::make_shared<ContextState>();
	child->parent = parent;
	child->deadline = parent->deadline;
	child->neverCancels = parent->neverCancels;
	return child;
}

// Child observes cancellation of its parent
void link(const std::shared_ptr<ContextState>& child) {
	ContextState* parent = child->parent.get();
	if (!parent || parent->neverCancels)
		return;
	std::weak_ptr<ContextState> weak = child;
	child->parentCallbackId = parent->addCallback([weak, parent]() {
		if (auto c = weak.lock())
			c->cancel(parent->error());
	});
}

Context::CancelFunc cancelFunc(const std::shared_ptr<ContextState>& state) {
	std::weak_ptr<ContextState> weak = state;
	return [weak]() {
		if (auto s = weak.lock())
			s->cancel(make_error_code(context_errc::canceled));
	};
}

} // namespace

Context::Context(std::shared_ptr<ContextState> state) : state_(std::move(state)) {}

Context Context::background() {
	static const std::shared_ptr<ContextState> root = [] {
		auto s = std::make_shared<ContextState>();
		s->neverCancels = true;
		return s;
	}();
	return Context(root);
}

std::pair<Context, Context::CancelFunc> Context::withCancel(const Context& parent) {
	auto state = derive(parent.state_);
	state->neverCancels = false;
	link(state);
	return {Context(state), cancelFunc(state)};
}

std::pair<Context, Context::CancelFunc> Context::withDeadline(const Context& parent, Clock::time_point deadline) {
	auto state = derive(parent.state_);
	state->neverCancels = false;
	if (!state->deadline || deadline < *state->deadline)
		state->deadline = deadline;
	link(state);
	return {Context(state), cancelFunc(state)};
}

std::pair<Context, Context::CancelFunc> Context::withTimeout(const Context& parent, Clock::duration timeout) {
	return withDeadline(parent, Clock::now() + timeout);
}

Context Context::withValue(const Context& parent, std::string key, std::string value) {
	auto state = derive(parent.state_);
	state->value.emplace(std::move(key), std::move(value));
	link(state);
	return Context(state);
}

bool Context::done() const {
	return static_cast<bool>(this->err());
}

std::error_code Context::err() const {
	if (this->state_->neverCancels)
		return {};
	this->state_->checkDeadline();
	return this->state_->error();
}

std::optional<Context::Clock::time_point> Context::deadline() const {
	return this->state_->deadline;
}

std::optional<std::string> Context::value(const std::string& key) const {
	for (const ContextState* s = this->state_.get(); s; s = s->parent.get()) {
		if (s->value && s->value->first == key)
			return s->value->second;
	}
	return std::nullopt;
}

std::error_code Context::sleepFor(Clock::duration duration) const {
	ContextState& s = *this->state_;
	if (duration <= Clock::duration::zero())
		return this->err();

	Clock::time_point wakeAt = Clock::now() + duration;
	bool bounded = false;
	if (s.deadline && *s.deadline <= wakeAt) {
		wakeAt = *s.deadline;
		bounded = true;
	}

	{
		std::unique_lock<std::mutex> lk(s.mutex);
		if (s.cv.wait_until(lk, wakeAt, [&s] { return static_cast<bool>(s.err); }))
			return s.err;
	}

	if (bounded)
		return this->err();
	return {};
}

Context::CallbackId Context::onCancel(std::function<void()> callback) const {
	if (this->state_->neverCancels)
		return 0;
	return this->state_->addCallback(std::move(callback));
}

void Context::removeCallback(CallbackId id) const {
	this->state_->removeCallback(id);
}

} // namespace retry_http
