#pragma once

#include <functional>
#include <iostream>
#include <mutex>
#include <string>

namespace retry_http {

enum class LogLevel { Trace, Debug, Info, Warn, Error, Off };

/**
 * Process-wide logger. Messages below the configured level are dropped;
 * the rest go to the sink (stderr by default), one call at a time.
 */
class Logger {
public:
	using Sink = std::function<void(LogLevel, const std::string&)>;

	static Logger& inst() {
		static Logger L;
		return L;
	}

	void setLevel(LogLevel lvl) {
		std::lock_guard<std::mutex> lk(this->m_);
		this->level_ = lvl;
	}

	LogLevel level() {
		std::lock_guard<std::mutex> lk(this->m_);
		return this->level_;
	}

	void setSink(Sink s) {
		std::lock_guard<std::mutex> lk(this->m_);
		this->sink_ = std::move(s);
	}

	bool enabled(LogLevel lvl) { return lvl >= this->level() && lvl != LogLevel::Off; }

	void log(LogLevel lvl, const std::string& msg) {
		std::lock_guard<std::mutex> lk(this->m_);
		if (lvl < this->level_ || lvl == LogLevel::Off || !this->sink_)
			return;
		this->sink_(lvl, msg);
	}

	static const char* name(LogLevel lvl) {
		static const char* names[]{"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "OFF"};
		return names[static_cast<int>(lvl)];
	}

private:
	Logger() {
		this->sink_ = [](LogLevel l, const std::string& m) {
			std::cerr << "[retry_http][" << Logger::name(l) << "] " << m << '\n';
		};
	}

	std::mutex m_;
	LogLevel level_{LogLevel::Warn};
	Sink sink_;
};

} // namespace retry_http

#define RETRY_HTTP_LOG(lvl, msg)                                                                                       \
	do {                                                                                                               \
		if (::retry_http::Logger::inst().enabled(lvl))                                                                 \
			::retry_http::Logger::inst().log(lvl, msg);                                                                \
	} while (0)

#define RETRY_HTTP_LOG_TRACE(msg) RETRY_HTTP_LOG(::retry_http::LogLevel::Trace, msg)
#define RETRY_HTTP_LOG_DEBUG(msg) RETRY_HTTP_LOG(::retry_http::LogLevel::Debug, msg)
#define RETRY_HTTP_LOG_INFO(msg) RETRY_HTTP_LOG(::retry_http::LogLevel::Info, msg)
#define RETRY_HTTP_LOG_WARN(msg) RETRY_HTTP_LOG(::retry_http::LogLevel::Warn, msg)
#define RETRY_HTTP_LOG_ERROR(msg) RETRY_HTTP_LOG(::retry_http::LogLevel::Error, msg)
