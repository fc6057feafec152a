#include "retry_http/HttpClient.hpp"
#include "retry_http/errors.hpp"

#include <stdexcept>
#include <utility>

namespace retry_http {

// HttpClient implementation
HttpClient::HttpClient(ClientConfig config)
	: config_(std::move(config)),
	  transport_(std::make_shared<CurlTransport>(this->config_.request, this->config_.transport)) {}

HttpClient::HttpClient(ClientConfig config, std::shared_ptr<Transport> transport)
	: config_(std::move(config)), transport_(std::move(transport)) {
	if (!this->transport_)
		throw std::invalid_argument("HttpClient: null transport");
}

std::vector<std::string> HttpClient::getPathsWithNoRetries() const {
	return std::vector<std::string>(this->config_.retry.pathsWithNoRetries.begin(),
									this->config_.retry.pathsWithNoRetries.end());
}

Result HttpClient::sendOnce(const Context& ctx, Transport& transport, HttpRequest& request) {
	std::unique_ptr<std::istream> body;
	if (request.hasBody()) {
		// A stream consumed by an earlier attempt cannot be replayed
		try {
			if (request.getBody)
				body = request.getBody();
		} catch (const std::exception&) {
			return Result::fromError(make_error_code(client_errc::body_unavailable));
		}
		if (!body)
			return Result::fromError(make_error_code(client_errc::body_unavailable));
	}
	return transport.perform(ctx, request, std::move(body));
}

Result HttpClient::send(const Context& ctx, HttpRequest& request) {
	addCorrelationHeaders(ctx, request);

	const SendFn sender = &HttpClient::sendOnce;
	const RetryPolicy& policy = this->config_.retry;

	Result first = sender(ctx, *this->transport_, request);
	if (auto ec = ctx.err())
		return Result::fromError(ec);
	if (!policy.retriesPath(request.path()) || !retry::wantRetry(first))
		return first;

	return retry::backoff(ctx, policy.maxRetries, policy.retryTime, sender, *this->transport_, request, std::move(first));
}

Result HttpClient::send(const Context& ctx, HttpRequest&& request) {
	HttpRequest req(std::move(request));
	return this->send(ctx, req);
}

Result HttpClient::get(const Context& ctx, const std::string& url) {
	return this->send(ctx, HttpRequest("GET", url));
}

Result HttpClient::head(const Context& ctx, const std::string& url) {
	return this->send(ctx, HttpRequest("HEAD", url));
}

Result HttpClient::post(const Context& ctx, const std::string& url, const std::string& contentType, std::string body) {
	HttpRequest request("POST", url);
	request.headers.set(kContentTypeHeader, contentType);
	request.setBody(std::move(body));
	return this->send(ctx, request);
}

Result HttpClient::put(const Context& ctx, const std::string& url, const std::string& contentType, std::string body) {
	HttpRequest request("PUT", url);
	request.headers.set(kContentTypeHeader, contentType);
	request.setBody(std::move(body));
	return this->send(ctx, request);
}

Result HttpClient::postForm(const Context& ctx, const std::string& url, const FormValues& data) {
	return this->post(ctx, url, kFormContentType, util::formEncode(data));
}

} // namespace retry_http
