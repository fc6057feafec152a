#include "retry_http/errors.hpp"

namespace retry_http {

namespace {

class ContextCategory : public std::error_category {
public:
	const char* name() const noexcept override { return "context"; }

	std::string message(int ev) const override {
		switch (static_cast<context_errc>(ev)) {
			case context_errc::canceled:
				return "context canceled";
			case context_errc::deadline_exceeded:
				return "context deadline exceeded";
			default:
				return "unknown context error";
		}
	}
};

class ClientCategory : public std::error_category {
public:
	const char* name() const noexcept override { return "retry_http"; }

	std::string message(int ev) const override {
		switch (static_cast<client_errc>(ev)) {
			case client_errc::body_unavailable:
				return "request body could not be re-obtained";
			default:
				return "unknown client error";
		}
	}
};

class CurlCategory : public std::error_category {
public:
	const char* name() const noexcept override { return "curl"; }

	std::string message(int ev) const override {
		return curl_easy_strerror(static_cast<CURLcode>(ev));
	}
};

class CurlMultiCategory : public std::error_category {
public:
	const char* name() const noexcept override { return "curl_multi"; }

	std::string message(int ev) const override {
		return curl_multi_strerror(static_cast<CURLMcode>(ev));
	}
};

} // namespace

const std::error_category& context_category() noexcept {
	static const ContextCategory category;
	return category;
}

const std::error_category& client_category() noexcept {
	static const ClientCategory category;
	return category;
}

const std::error_category& curl_category() noexcept {
	static const CurlCategory category;
	return category;
}

const std::error_category& curl_multi_category() noexcept {
	static const CurlMultiCategory category;
	return category;
}

std::error_code make_error_code(context_errc e) noexcept {
	return {static_cast<int>(e), context_category()};
}

std::error_code make_error_code(client_errc e) noexcept {
	return {static_cast<int>(e), client_category()};
}

std::error_code make_error_code(CURLcode e) noexcept {
	return {static_cast<int>(e), curl_category()};
}

std::error_code make_error_code(CURLMcode e) noexcept {
	return {static_cast<int>(e), curl_multi_category()};
}

} // namespace retry_http
