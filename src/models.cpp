#include "retry_http/models.hpp"

#include <sstream>
#include <stdexcept>

namespace retry_http {

namespace {
const std::vector<std::string> kNoValues;
}

std::string Headers::get(const std::string& name) const {
	auto it = this->map_.find(name);
	if (it == this->map_.end() || it->second.empty())
		return {};
	return it->second.front();
}

const std::vector<std::string>& Headers::values(const std::string& name) const {
	auto it = this->map_.find(name);
	return it == this->map_.end() ? kNoValues : it->second;
}

bool Headers::has(const std::string& name) const {
	return this->map_.count(name) > 0;
}

void Headers::set(const std::string& name, std::string value) {
	auto& vals = this->map_[name];
	vals.clear();
	vals.emplace_back(std::move(value));
}

void Headers::add(const std::string& name, std::string value) {
	this->map_[name].emplace_back(std::move(value));
}

void Headers::remove(const std::string& name) {
	this->map_.erase(name);
}

bool Headers::addLine(std::string_view line) {
	size_t colon = line.find(':');
	if (colon == std::string_view::npos || colon == 0)
		return false;
	this->add(std::string(util::trim(line.substr(0, colon))), std::string(util::trim(line.substr(colon + 1))));
	return true;
}

std::vector<std::string> Headers::lines() const {
	std::vector<std::string> out;
	for (const auto& [name, vals] : this->map_)
		for (const auto& v : vals)
			out.emplace_back(name + ": " + v);
	return out;
}

HttpRequest::HttpRequest(std::string methodName, std::string url)
	: url(std::move(url)), methodName(std::move(methodName)) {}

void HttpRequest::setBody(std::string body) {
	if (body.empty()) {
		this->getBody = nullptr;
		this->contentLength = 0;
		return;
	}
	auto shared = std::make_shared<const std::string>(std::move(body));
	this->contentLength = static_cast<int64_t>(shared->size());
	this->getBody = [shared]() -> std::unique_ptr<std::istream> {
		return std::make_unique<std::istringstream>(*shared);
	};
}

void HttpRequest::setBody(BodyFactory factory, int64_t length) {
	if (length > 0 && !factory)
		throw std::invalid_argument("HttpRequest: body length given without a body factory");
	this->getBody = std::move(factory);
	this->contentLength = length;
}

std::string HttpRequest::path() const {
	CURLU* handle = curl_url();
	if (!handle)
		return {};

	std::string result;
	if (curl_url_set(handle, CURLUPART_URL, this->url.c_str(), 0) == CURLUE_OK) {
		char* part = nullptr;
		if (curl_url_get(handle, CURLUPART_PATH, &part, CURLU_URLDECODE) == CURLUE_OK && part) {
			result = part;
			curl_free(part);
		}
	}
	curl_url_cleanup(handle);
	return result;
}

} // namespace retry_http
