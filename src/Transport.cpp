#include "retry_http/Transport.hpp"
#include "retry_http/errors.hpp"
#include "retry_http/logger.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace retry_http {

void ensureCurlGlobalInit() {
	static std::once_flag inited;

	std::call_once(inited, []() {
		auto rc = curl_global_init(CURL_GLOBAL_DEFAULT);
		if (rc != CURLE_OK) throw std::runtime_error("curl_global_init failed");
		std::atexit([]{ curl_global_cleanup(); });
	});
}

inline static double current_time() {
	return std::chrono::duration<double>(
		std::chrono::system_clock::now().time_since_epoch()).count();
}

// TransportSettings implementation
void TransportSettings::applyCurlEasySettings(CURL* handle) const {
	curl_easy_setopt(handle, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_NONE);
	curl_easy_setopt(handle, CURLOPT_FORBID_REUSE, 0L);
	curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 1L);
	curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(handle, CURLOPT_TCP_KEEPALIVE, 1L);
	curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, this->followRedirects ? 1L : 0L);
	curl_easy_setopt(handle, CURLOPT_MAXAGE_CONN, static_cast<long>(this->idleConnectionTimeout.count()));
	curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, this->verifyPeer ? 1L : 0L);
	curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, this->verifyPeer ? 2L : 0L);
	if (!this->userAgent.empty())
		curl_easy_setopt(handle, CURLOPT_USERAGENT, this->userAgent.c_str());
}

void TransportSettings::applyCurlMultiSettings(CURLM* handle) const {
	curl_multi_setopt(handle, CURLMOPT_MAXCONNECTS, this->maxIdleConnections);
}

// HttpTransfer implementation
HttpTransfer::HttpTransfer(const HttpRequest& request, const RequestPolicy& policy,
						   const TransportSettings& settings, std::unique_ptr<std::istream> body)
	: method_(util::toupper(request.methodName)), body_(std::move(body)) {
	this->curlEasy = curl_easy_init();
	if (!this->curlEasy)
		throw std::runtime_error("curl_easy_init failed");

	settings.applyCurlEasySettings(this->curlEasy);

	curl_easy_setopt(this->curlEasy, CURLOPT_URL, request.url.c_str());
	if (policy.timeout.count() > 0)
		curl_easy_setopt(this->curlEasy, CURLOPT_TIMEOUT_MS, static_cast<long>(policy.timeout.count()));
	if (policy.connTimeout.count() > 0)
		curl_easy_setopt(this->curlEasy, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(policy.connTimeout.count()));
	if (policy.sendSpeedLimit)
		curl_easy_setopt(this->curlEasy, CURLOPT_MAX_SEND_SPEED_LARGE, static_cast<curl_off_t>(policy.sendSpeedLimit));
	if (policy.recvSpeedLimit)
		curl_easy_setopt(this->curlEasy, CURLOPT_MAX_RECV_SPEED_LARGE, static_cast<curl_off_t>(policy.recvSpeedLimit));
	if (policy.lowSpeedLimit && policy.lowSpeedTime) {
		curl_easy_setopt(this->curlEasy, CURLOPT_LOW_SPEED_TIME, static_cast<long>(policy.lowSpeedTime));
		curl_easy_setopt(this->curlEasy, CURLOPT_LOW_SPEED_LIMIT, static_cast<long>(policy.lowSpeedLimit));
	}
	if (policy.curlBufferSize) {
		long buf_size = std::clamp(policy.curlBufferSize, 1024u, static_cast<unsigned int>(CURL_MAX_READ_SIZE));
		curl_easy_setopt(this->curlEasy, CURLOPT_BUFFERSIZE, buf_size);
	}

	for (const auto& header : request.headers.lines()) {
		this->headers_ = curl_slist_append(this->headers_, header.c_str());
	}
	// The body is streamed once per attempt; never wait for a 100-continue
	this->headers_ = curl_slist_append(this->headers_, "Expect:");
	curl_easy_setopt(this->curlEasy, CURLOPT_HTTPHEADER, this->headers_);

	const bool withBody = this->body_ && request.contentLength > 0;
	switch (HttpRequest::method2Enum(this->method_)) {
		case HttpRequest::HEAD: {
			curl_easy_setopt(this->curlEasy, CURLOPT_NOBODY, 1L);
			break;
		}
		case HttpRequest::GET: {
			if (!withBody) {
				curl_easy_setopt(this->curlEasy, CURLOPT_HTTPGET, 1L);
				break;
			}
			curl_easy_setopt(this->curlEasy, CURLOPT_CUSTOMREQUEST, this->method_.c_str());
			break;
		}
		case HttpRequest::POST: {
			curl_easy_setopt(this->curlEasy, CURLOPT_POST, 1L);
			if (!withBody)
				curl_easy_setopt(this->curlEasy, CURLOPT_POSTFIELDS, "");
			break;
		}
		default: {
			curl_easy_setopt(this->curlEasy, CURLOPT_CUSTOMREQUEST, this->method_.c_str());
		}
	}

	if (withBody) {
		curl_easy_setopt(this->curlEasy, CURLOPT_POST, 1L);
		curl_easy_setopt(this->curlEasy, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.contentLength));
		curl_easy_setopt(this->curlEasy, CURLOPT_READFUNCTION, HttpTransfer::read_cb);
		curl_easy_setopt(this->curlEasy, CURLOPT_READDATA, this);
		curl_easy_setopt(this->curlEasy, CURLOPT_SEEKFUNCTION, HttpTransfer::seek_cb);
		curl_easy_setopt(this->curlEasy, CURLOPT_SEEKDATA, this);
	}

	curl_easy_setopt(this->curlEasy, CURLOPT_WRITEFUNCTION, HttpTransfer::body_cb);
	curl_easy_setopt(this->curlEasy, CURLOPT_WRITEDATA, this);
	curl_easy_setopt(this->curlEasy, CURLOPT_HEADERFUNCTION, HttpTransfer::header_cb);
	curl_easy_setopt(this->curlEasy, CURLOPT_HEADERDATA, this);
}

HttpTransfer::~HttpTransfer() {
	curl_easy_cleanup(this->curlEasy);
	curl_slist_free_all(this->headers_);
}

const HttpResponse& HttpTransfer::getResponse() const {
	return this->response;
}

HttpResponse HttpTransfer::detachResponse() {
	return std::move(this->response);
}

void HttpTransfer::finalize_transfer() {
	curl_easy_getinfo(this->curlEasy, CURLINFO_RESPONSE_CODE, &this->response.status);

	curl_off_t connect = 0, appConnect = 0, preTransfer = 0, startTransfer = 0, total = 0, redir = 0;
	curl_easy_getinfo(this->curlEasy, CURLINFO_CONNECT_TIME_T, &connect);
	curl_easy_getinfo(this->curlEasy, CURLINFO_APPCONNECT_TIME_T, &appConnect);
	curl_easy_getinfo(this->curlEasy, CURLINFO_PRETRANSFER_TIME_T, &preTransfer);
	curl_easy_getinfo(this->curlEasy, CURLINFO_STARTTRANSFER_TIME_T, &startTransfer);
	curl_easy_getinfo(this->curlEasy, CURLINFO_TOTAL_TIME_T, &total);
	curl_easy_getinfo(this->curlEasy, CURLINFO_REDIRECT_TIME_T, &redir);

	// APPCONNECT stays 0 on plain HTTP
	if (appConnect == 0)
		appConnect = connect;

	constexpr float us2s = 1e-6f;
	this->response.transferInfo.connect = connect * us2s;
	this->response.transferInfo.appConnect = (appConnect - connect) * us2s;
	this->response.transferInfo.preTransfer = (preTransfer - appConnect) * us2s;
	this->response.transferInfo.startTransfer = (startTransfer - preTransfer) * us2s;
	this->response.transferInfo.ttfb = startTransfer * us2s;
	this->response.transferInfo.receiveTransfer = (total - startTransfer) * us2s;
	this->response.transferInfo.total = total * us2s;
	this->response.transferInfo.redir = redir * us2s;

	this->response.transferInfo.completeAt = current_time();
}

size_t HttpTransfer::body_cb(void* ptr, size_t size, size_t nmemb, void* data) {
	HttpTransfer* transfer = static_cast<HttpTransfer*>(data);
	transfer->response.body.append(static_cast<const char*>(ptr), size * nmemb);
	return size * nmemb;
}

size_t HttpTransfer::header_cb(void* ptr, size_t size, size_t nmemb, void* data) {
	HttpTransfer* transfer = static_cast<HttpTransfer*>(data);

	const size_t len = size * nmemb;
	if (!ptr || len == 0)
		return len;

	std::string_view sv = util::trim(std::string_view(static_cast<const char*>(ptr), len));
	if (sv.empty())
		return len;

	// A status line starts a new response (redirects, 1xx); drop earlier headers
	if (sv.rfind("HTTP/", 0) == 0) {
		transfer->response.headers = Headers();
		return len;
	}

	transfer->response.headers.addLine(sv);
	return len;
}

size_t HttpTransfer::read_cb(char* buffer, size_t size, size_t nitems, void* data) {
	HttpTransfer* transfer = static_cast<HttpTransfer*>(data);
	if (!transfer->body_)
		return 0;

	transfer->body_->read(buffer, static_cast<std::streamsize>(size * nitems));
	if (transfer->body_->bad())
		return CURL_READFUNC_ABORT;
	return static_cast<size_t>(transfer->body_->gcount());
}

int HttpTransfer::seek_cb(void* data, curl_off_t offset, int origin) {
	HttpTransfer* transfer = static_cast<HttpTransfer*>(data);
	if (!transfer->body_ || origin != SEEK_SET)
		return CURL_SEEKFUNC_CANTSEEK;

	transfer->body_->clear();
	transfer->body_->seekg(static_cast<std::streamoff>(offset), std::ios::beg);
	return transfer->body_->fail() ? CURL_SEEKFUNC_CANTSEEK : CURL_SEEKFUNC_OK;
}

namespace {

// Lets a context callback wake a multi handle that may already be gone
struct MultiWaker {
	std::mutex mutex;
	CURLM* multi = nullptr;

	void wake() {
		std::lock_guard<std::mutex> lk(this->mutex);
		if (this->multi)
			curl_multi_wakeup(this->multi);
	}

	void disarm() {
		std::lock_guard<std::mutex> lk(this->mutex);
		this->multi = nullptr;
	}
};

int pollTimeout(CURLM* multi, const Context& ctx) {
	long t = -1;
	curl_multi_timeout(multi, &t);

	long poll_timeout;
	if (t < 0)
		poll_timeout = RETRY_HTTP_POLL_MS;
	else
		poll_timeout = std::min<long>(t, RETRY_HTTP_POLL_MS);

	if (auto deadline = ctx.deadline()) {
		auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Context::Clock::now()).count();
		poll_timeout = std::clamp<long>(static_cast<long>(left) + 1, 0L, poll_timeout);
	}
	return static_cast<int>(poll_timeout);
}

} // namespace

// CurlTransport implementation
CurlTransport::CurlTransport(RequestPolicy policy, TransportSettings settings)
	: policy_(std::move(policy)), settings_(std::move(settings)) {
	ensureCurlGlobalInit();

	this->share_ = curl_share_init();
	if (!this->share_)
		throw std::runtime_error("curl_share_init failed");
	curl_share_setopt(this->share_, CURLSHOPT_LOCKFUNC, CurlTransport::share_lock);
	curl_share_setopt(this->share_, CURLSHOPT_UNLOCKFUNC, CurlTransport::share_unlock);
	curl_share_setopt(this->share_, CURLSHOPT_USERDATA, this);
	curl_share_setopt(this->share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
	curl_share_setopt(this->share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
}

CurlTransport::~CurlTransport() {
	std::lock_guard<std::mutex> lk(this->poolMutex_);
	for (CURLM* multi : this->idleMultis_)
		curl_multi_cleanup(multi);
	this->idleMultis_.clear();
	curl_share_cleanup(this->share_);
}

void CurlTransport::share_lock(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
	auto* self = static_cast<CurlTransport*>(userptr);
	self->shareLocks_[static_cast<size_t>(data) % CURL_LOCK_DATA_LAST].lock();
}

void CurlTransport::share_unlock(CURL*, curl_lock_data data, void* userptr) {
	auto* self = static_cast<CurlTransport*>(userptr);
	self->shareLocks_[static_cast<size_t>(data) % CURL_LOCK_DATA_LAST].unlock();
}

CURLM* CurlTransport::acquireMulti() {
	{
		std::lock_guard<std::mutex> lk(this->poolMutex_);
		if (!this->idleMultis_.empty()) {
			CURLM* multi = this->idleMultis_.back();
			this->idleMultis_.pop_back();
			return multi;
		}
	}

	CURLM* multi = curl_multi_init();
	if (!multi)
		throw std::runtime_error("curl_multi_init failed");
	this->settings_.applyCurlMultiSettings(multi);
	return multi;
}

void CurlTransport::releaseMulti(CURLM* multi) {
	std::lock_guard<std::mutex> lk(this->poolMutex_);
	if (static_cast<long>(this->idleMultis_.size()) < std::max(1L, this->settings_.maxIdleConnections))
		this->idleMultis_.push_back(multi);
	else
		curl_multi_cleanup(multi);
}

Result CurlTransport::perform(const Context& ctx, const HttpRequest& request, std::unique_ptr<std::istream> body) {
	if (auto ec = ctx.err())
		return Result::fromError(ec);

	HttpTransfer transfer(request, this->policy_, this->settings_, std::move(body));
	curl_easy_setopt(transfer.handle(), CURLOPT_SHARE, this->share_);

	CURLM* multi = this->acquireMulti();
	auto waker = std::make_shared<MultiWaker>();
	waker->multi = multi;

	CURLMcode mc = curl_multi_add_handle(multi, transfer.handle());
	if (mc != CURLM_OK) {
		curl_multi_cleanup(multi);
		RETRY_HTTP_LOG_WARN(std::string("curl_multi_add_handle failed: ") + curl_multi_strerror(mc));
		return Result::fromError(make_error_code(mc));
	}

	CURLcode curlCode = CURLE_OK;
	bool finished = false;
	{
		ScopedCancelCallback wakeOnCancel(ctx, [waker]() { waker->wake(); });

		while (!finished) {
			int still_running = 0;
			mc = curl_multi_perform(multi, &still_running);
			if (mc != CURLM_OK)
				break;

			CURLMsg* msg;
			do {
				int msgq = 0;
				msg = curl_multi_info_read(multi, &msgq);
				if (msg && msg->msg == CURLMSG_DONE && msg->easy_handle == transfer.handle()) {
					curlCode = msg->data.result;
					finished = true;
				}
			} while (msg);

			if (finished || ctx.done())
				break;

			mc = curl_multi_poll(multi, nullptr, 0, pollTimeout(multi, ctx), nullptr);
			if (mc != CURLM_OK)
				break;
		}
	}
	waker->disarm();

	curl_multi_remove_handle(multi, transfer.handle());
	if (mc != CURLM_OK) {
		// The handle may be in a bad state; do not pool it
		curl_multi_cleanup(multi);
		RETRY_HTTP_LOG_WARN(request.methodName + " " + request.url + " multi interface failed: " + curl_multi_strerror(mc));
		return Result::fromError(make_error_code(mc));
	}
	this->releaseMulti(multi);

	// A response that lands after cancellation is discarded
	if (auto ec = ctx.err()) {
		RETRY_HTTP_LOG_DEBUG(request.methodName + " " + request.url + " abandoned: " + ec.message());
		return Result::fromError(ec);
	}

	if (curlCode != CURLE_OK) {
		RETRY_HTTP_LOG_DEBUG(request.methodName + " " + request.url + " failed: " + curl_easy_strerror(curlCode));
		return Result::fromError(make_error_code(curlCode));
	}

	transfer.finalize_transfer();
	RETRY_HTTP_LOG_TRACE(request.methodName + " " + request.url + " -> " + std::to_string(transfer.getResponse().status));
	return Result::fromResponse(transfer.detachResponse());
}

} // namespace retry_http
