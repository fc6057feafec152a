#pragma once

#include <string>
#include <system_error>

#ifdef __cplusplus
extern "C" {
#endif
#include <curl/curl.h>
#ifdef __cplusplus
}
#endif

namespace retry_http {

/**
 * Errors raised by a Context when it stops being usable.
 * Messages follow the usual "context canceled" / "context deadline exceeded" wording.
 */
enum class context_errc {
    canceled = 1,
    deadline_exceeded = 2,
};

/**
 * Errors produced by the client itself, before or around a transfer.
 */
enum class client_errc {
    body_unavailable = 1,          // the body factory threw or returned no stream
};

const std::error_category& context_category() noexcept;
const std::error_category& client_category() noexcept;
const std::error_category& curl_category() noexcept;
const std::error_category& curl_multi_category() noexcept;

std::error_code make_error_code(context_errc e) noexcept;
std::error_code make_error_code(client_errc e) noexcept;
std::error_code make_error_code(CURLcode e) noexcept;
std::error_code make_error_code(CURLMcode e) noexcept;

inline bool is_context_error(const std::error_code& ec) noexcept {
    return ec.category() == context_category();
}

} // namespace retry_http

namespace std {
template <> struct is_error_code_enum<retry_http::context_errc> : true_type {};
template <> struct is_error_code_enum<retry_http::client_errc> : true_type {};
} // namespace std
