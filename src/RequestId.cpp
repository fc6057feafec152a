#include "retry_http/RequestId.hpp"

#include <stdexcept>
#include <vector>

#ifdef __cplusplus
extern "C" {
#endif
#include <openssl/rand.h>
#ifdef __cplusplus
}
#endif

namespace retry_http {

namespace {
constexpr std::string_view kAlphabet = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
}

std::string newRequestId(size_t length) {
	std::string id;
	if (length == 0)
		return id;

	id.reserve(length);
	std::vector<unsigned char> buf(length);
	// Rejection sampling keeps the alphabet uniform: 248 = 4 * 62
	constexpr unsigned char limit = static_cast<unsigned char>((256 / kAlphabet.size()) * kAlphabet.size());
	while (id.size() < length) {
		if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1)
			throw std::runtime_error("RAND_bytes failed");
		for (unsigned char b : buf) {
			if (b >= limit)
				continue;
			id.push_back(kAlphabet[b % kAlphabet.size()]);
			if (id.size() == length)
				break;
		}
	}
	return id;
}

std::string buildRequestId(std::string_view upstream) {
	if (upstream.empty())
		return newRequestId(kDefaultRequestIdLength);

	size_t addedLen = upstream.size() / 2;
	size_t comma = upstream.find(',');
	if (comma != std::string_view::npos && comma > 1)
		addedLen = comma / 2;

	std::string chain(upstream);
	chain.push_back(',');
	chain += newRequestId(addedLen);
	return chain;
}

Context withRequestId(const Context& ctx, std::string requestId) {
	return Context::withValue(ctx, kRequestIdKey, std::move(requestId));
}

std::string getRequestId(const Context& ctx) {
	return ctx.value(kRequestIdKey).value_or("");
}

Context withUser(const Context& ctx, std::string user) {
	return Context::withValue(ctx, kUserIdentityKey, std::move(user));
}

std::string getUser(const Context& ctx) {
	return ctx.value(kUserIdentityKey).value_or("");
}

void addCorrelationHeaders(const Context& ctx, HttpRequest& request) {
	std::string user = getUser(ctx);
	if (!user.empty() && request.headers.get(kUserIdentityHeader).empty())
		request.headers.set(kUserIdentityHeader, std::move(user));

	request.headers.set(kRequestIdHeader, buildRequestId(getRequestId(ctx)));
}

} // namespace retry_http
