#pragma once

#include "utils.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <istream>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#ifdef __cplusplus
extern "C" {
#endif
#include <curl/curl.h>
#ifdef __cplusplus
}
#endif

namespace retry_http {

struct RequestPolicy {
	std::chrono::milliseconds timeout{10000};		// whole attempt, connection included (<=0 means wait indefinitely)
	std::chrono::milliseconds connTimeout{5000};	// DNS + TCP dial + TLS handshake (<=0 means libcurl default)

	uint32_t lowSpeedLimit = 0;	// in bytes
	uint32_t lowSpeedTime = 0;	// in seconds
	uint32_t sendSpeedLimit = 0;	// bytes per second
	uint32_t recvSpeedLimit = 0;	// bytes per second

	uint32_t curlBufferSize = CURL_MAX_WRITE_SIZE; // in bytes
};

// Fuck you, <winnt.h>
#ifdef _WIN32
#ifdef DELETE
#undef DELETE
#endif
#endif

/**
 * Header set with case-insensitive names. A name may carry several values.
 */
class Headers {
public:
	using Map = std::map<std::string, std::vector<std::string>, util::CaseInsensitiveLess>;

	// First value for the name, empty when absent
	std::string get(const std::string& name) const;
	const std::vector<std::string>& values(const std::string& name) const;
	bool has(const std::string& name) const;

	void set(const std::string& name, std::string value);
	void add(const std::string& name, std::string value);
	void remove(const std::string& name);

	// Parses one "Name: value" line; returns false if the line has no colon
	bool addLine(std::string_view line);
	std::vector<std::string> lines() const;

	size_t size() const { return this->map_.size(); }
	bool empty() const { return this->map_.empty(); }
	Map::const_iterator begin() const { return this->map_.begin(); }
	Map::const_iterator end() const { return this->map_.end(); }

private:
	Map map_;
};

/**
 * Produces a fresh, independently readable stream over the same body bytes.
 * Called once per attempt.
 */
using BodyFactory = std::function<std::unique_ptr<std::istream>()>;

struct HttpRequest {
public:
#define HTTP_METHODS                                                                                                   \
	HTTP_METHOD(GET)                                                                                                   \
	HTTP_METHOD(POST)                                                                                                  \
	HTTP_METHOD(HEAD)                                                                                                  \
	HTTP_METHOD(PATCH)                                                                                                 \
	HTTP_METHOD(PUT)                                                                                                   \
	HTTP_METHOD(DELETE)

	enum Method : uint8_t {
#define HTTP_METHOD(methodName) methodName,
		HTTP_METHODS
#undef HTTP_METHOD
			OTHER = 255
	};
	static constexpr std::string_view MethodStr[] = {
#define HTTP_METHOD(methodName) #methodName,
		HTTP_METHODS
#undef HTTP_METHOD
	};
	// Enumerators follow MethodStr order
	static Method method2Enum(const std::string& methodName) {
		const std::string upper = util::toupper(methodName);
		for (size_t i = 0; i < std::size(MethodStr); ++i) {
			if (MethodStr[i] == upper)
				return static_cast<Method>(i);
		}
		return Method::OTHER;
	};

	HttpRequest() = default;
	HttpRequest(std::string methodName, std::string url);

	std::string url;
	std::string methodName;
	Headers headers;

	BodyFactory getBody;			// null when the request has no body
	int64_t contentLength = 0;

	// Installs a factory that replays a shared copy of the given bytes
	void setBody(std::string body);
	void setBody(BodyFactory factory, int64_t length);
	bool hasBody() const { return this->contentLength > 0; }

	// Decoded path component of the URL, empty if the URL does not parse
	std::string path() const;
};

struct TransferInfo {
	// Wall clock, in seconds since epoch
	double startAt = std::chrono::duration<double>(
		std::chrono::system_clock::now().time_since_epoch()).count();
	double completeAt = 0;

	// Phase durations, in seconds. ttfb spans from the start of the transfer to the first response byte.
	float connect = 0, appConnect = 0, preTransfer = 0, ttfb = 0, startTransfer = 0, receiveTransfer = 0, total = 0, redir = 0;
};

struct HttpResponse {
	long status = 0;

	Headers headers;
	std::string body;

	TransferInfo transferInfo;
};

/**
 * Outcome of one attempt: a response or an error, never both.
 */
struct Result {
	std::optional<HttpResponse> response;
	std::error_code error;

	static Result fromResponse(HttpResponse response) {
		Result r;
		r.response.emplace(std::move(response));
		return r;
	}
	static Result fromError(std::error_code error) {
		Result r;
		r.error = error;
		return r;
	}

	bool ok() const { return !this->error && this->response.has_value(); }
};

} // namespace retry_http
