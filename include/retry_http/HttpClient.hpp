#pragma once

#include "Backoff.hpp"
#include "Context.hpp"
#include "RequestId.hpp"
#include "RetryPolicy.hpp"
#include "Transport.hpp"
#include "config.hpp"
#include "models.hpp"
#include "utils.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace retry_http {

constexpr const char* kContentTypeHeader = "Content-Type";
constexpr const char* kFormContentType = "application/x-www-form-urlencoded";

/**
 * HTTP client with retries under exponential backoff, context cancellation,
 * per-path retry opt-out and X-Request-Id propagation.
 *
 * The configuration is fixed at construction; concurrent send() calls only
 * read it. A result carries either a response, which may hold a 5xx status,
 * or an error, never both.
 */
class HttpClient {
public:
	explicit HttpClient(ClientConfig config = ClientConfig());
	HttpClient(ClientConfig config, std::shared_ptr<Transport> transport);

	HttpClient(const HttpClient&) = delete;
	HttpClient& operator=(const HttpClient&) = delete;

	Result send(const Context& ctx, HttpRequest& request);
	Result send(const Context& ctx, HttpRequest&& request);

	Result get(const Context& ctx, const std::string& url);
	Result head(const Context& ctx, const std::string& url);
	Result post(const Context& ctx, const std::string& url, const std::string& contentType, std::string body);
	Result put(const Context& ctx, const std::string& url, const std::string& contentType, std::string body);
	Result postForm(const Context& ctx, const std::string& url, const FormValues& data);

	const ClientConfig& config() const { return this->config_; }
	uint32_t getMaxRetries() const { return this->config_.retry.maxRetries; }
	std::chrono::milliseconds getTimeout() const { return this->config_.request.timeout; }
	std::vector<std::string> getPathsWithNoRetries() const;

	// Single attempt: re-obtains the body, then hands the request to the transport
	static Result sendOnce(const Context& ctx, Transport& transport, HttpRequest& request);

private:
	ClientConfig config_;
	std::shared_ptr<Transport> transport_;
};

} // namespace retry_http
