#include "retry_http/config.hpp"
#include "retry_http/utils.hpp"

#include <cstdlib>
#include <limits>
#include <set>
#include <stdexcept>
#include <string>

namespace retry_http {

// ClientConfig implementation
ClientConfig ClientConfig::withTimeout(std::chrono::milliseconds timeout) const {
	ClientConfig c(*this);
	c.request.timeout = timeout;
	return c;
}

ClientConfig ClientConfig::withMaxRetries(uint32_t maxRetries) const {
	ClientConfig c(*this);
	c.retry.maxRetries = maxRetries;
	return c;
}

ClientConfig ClientConfig::withRetryTime(std::chrono::milliseconds retryTime) const {
	ClientConfig c(*this);
	c.retry.retryTime = retryTime;
	return c;
}

ClientConfig ClientConfig::withPathsWithNoRetries(const std::vector<std::string>& paths) const {
	ClientConfig c(*this);
	c.retry.pathsWithNoRetries = std::set<std::string>(paths.begin(), paths.end());
	return c;
}

static std::string env(const char* key, const std::string& def = "") {
	const char* v = std::getenv(key);
	return v ? std::string(v) : def;
}

static int64_t envInt(const char* key, int64_t def, int64_t min, int64_t max) {
	std::string raw(util::trim(env(key)));
	if (raw.empty())
		return def;

	size_t pos = 0;
	long long value = 0;
	try {
		value = std::stoll(raw, &pos);
	} catch (const std::exception&) {
		throw std::invalid_argument(std::string(key) + ": not an integer: " + raw);
	}
	if (pos != raw.size())
		throw std::invalid_argument(std::string(key) + ": not an integer: " + raw);
	if (value < min || value > max)
		throw std::invalid_argument(std::string(key) + ": out of range: " + raw);
	return value;
}

LogLevel parseLogLevel(const std::string& name, LogLevel def) {
	std::string n = util::toupper(std::string(util::trim(name)));
	if (n == "TRACE") return LogLevel::Trace;
	if (n == "DEBUG") return LogLevel::Debug;
	if (n == "INFO") return LogLevel::Info;
	if (n == "WARN" || n == "WARNING") return LogLevel::Warn;
	if (n == "ERROR") return LogLevel::Error;
	if (n == "OFF") return LogLevel::Off;
	return def;
}

ClientConfig loadConfigFromEnv(ClientConfig base) {
	ClientConfig c(std::move(base));
	constexpr int64_t maxMs = std::numeric_limits<int32_t>::max();

	c.retry.maxRetries = static_cast<uint32_t>(
		envInt("RETRY_HTTP_MAX_RETRIES", c.retry.maxRetries, 0, 1000));
	c.retry.retryTime = std::chrono::milliseconds(
		envInt("RETRY_HTTP_RETRY_TIME_MS", c.retry.retryTime.count(), 0, maxMs));
	c.request.timeout = std::chrono::milliseconds(
		envInt("RETRY_HTTP_TIMEOUT_MS", c.request.timeout.count(), 0, maxMs));
	c.request.connTimeout = std::chrono::milliseconds(
		envInt("RETRY_HTTP_CONNECT_TIMEOUT_MS", c.request.connTimeout.count(), 0, maxMs));

	std::string paths = env("RETRY_HTTP_NO_RETRY_PATHS");
	if (!paths.empty()) {
		c.retry.pathsWithNoRetries.clear();
		for (const auto& p : util::split(paths, ',')) {
			std::string_view path = util::trim(p);
			if (!path.empty())
				c.retry.pathsWithNoRetries.emplace(path);
		}
	}

	std::string level = env("RETRY_HTTP_LOG_LEVEL");
	if (!level.empty())
		Logger::inst().setLevel(parseLogLevel(level, Logger::inst().level()));

	return c;
}

} // namespace retry_http
