#pragma once

#include "Context.hpp"
#include "models.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <istream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#ifdef __cplusplus
extern "C" {
#endif
#include <curl/curl.h>
#ifdef __cplusplus
}
#endif

namespace retry_http {

#define RETRY_HTTP_POLL_MS 100L

/**
 * libcurl tuning shared by every transfer of a transport. Connection-level only;
 * retry behaviour lives in ClientConfig.
 */
struct TransportSettings {
	long maxIdleConnections = 10;
	std::chrono::seconds idleConnectionTimeout{30};
	bool followRedirects = true;
	bool verifyPeer = true;
	std::string userAgent = "retry_http/1.0";

	void applyCurlEasySettings(CURL* handle) const;
	void applyCurlMultiSettings(CURLM* handle) const;
};

/**
 * Performs exactly one attempt of a request. `body` is a fresh stream over the
 * request body, null when there is none. The attempt must give up as soon as
 * the context is done, returning the context's error.
 */
class Transport {
public:
	virtual ~Transport() = default;

	virtual Result perform(const Context& ctx, const HttpRequest& request, std::unique_ptr<std::istream> body) = 0;
};

/**
 * One libcurl easy handle configured for a single attempt.
 */
class HttpTransfer {
public:
	HttpTransfer(const HttpRequest& request, const RequestPolicy& policy, const TransportSettings& settings,
				 std::unique_ptr<std::istream> body);
	~HttpTransfer();

	HttpTransfer(const HttpTransfer&) = delete;
	HttpTransfer& operator=(const HttpTransfer&) = delete;

	CURL* handle() const { return this->curlEasy; }
	const HttpResponse& getResponse() const;
	HttpResponse detachResponse();
	void finalize_transfer();

private:
	CURL* curlEasy = nullptr;
	struct curl_slist* headers_ = nullptr;
	std::string method_;
	std::unique_ptr<std::istream> body_;
	HttpResponse response;

	static size_t body_cb(void* ptr, size_t size, size_t nmemb, void* data);
	static size_t header_cb(void* ptr, size_t size, size_t nmemb, void* data);
	static size_t read_cb(char* buffer, size_t size, size_t nitems, void* data);
	static int seek_cb(void* data, curl_off_t offset, int origin);
};

/**
 * Transport backed by libcurl. Each attempt runs on a private multi handle
 * so that it can be interrupted by the context; idle multi handles, and the
 * connections they cache, are reused by later attempts. DNS and TLS session
 * caches are shared across all of them.
 */
class CurlTransport : public Transport {
public:
	explicit CurlTransport(RequestPolicy policy = RequestPolicy(), TransportSettings settings = TransportSettings());
	~CurlTransport() override;

	CurlTransport(const CurlTransport&) = delete;
	CurlTransport& operator=(const CurlTransport&) = delete;

	Result perform(const Context& ctx, const HttpRequest& request, std::unique_ptr<std::istream> body) override;

	const RequestPolicy& policy() const { return this->policy_; }
	const TransportSettings& settings() const { return this->settings_; }

private:
	CURLM* acquireMulti();
	void releaseMulti(CURLM* multi);

	static void share_lock(CURL* handle, curl_lock_data data, curl_lock_access access, void* userptr);
	static void share_unlock(CURL* handle, curl_lock_data data, void* userptr);

	RequestPolicy policy_;
	TransportSettings settings_;

	CURLSH* share_ = nullptr;
	std::array<std::mutex, CURL_LOCK_DATA_LAST> shareLocks_;

	std::mutex poolMutex_;
	std::vector<CURLM*> idleMultis_;
};

// Runs curl_global_init once per process
void ensureCurlGlobalInit();

} // namespace retry_http
