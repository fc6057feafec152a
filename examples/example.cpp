#include "retry_http/HttpClient.hpp"
#include "retry_http/logger.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using namespace std::chrono_literals;

void printResult(const retry_http::Result& result) {
	if (result.error) {
		std::cout << "Error: " << result.error.message() << " (" << result.error.category().name() << ")" << std::endl;
		return;
	}
	const auto& response = *result.response;
	std::cout << "Elapsed: " << response.transferInfo.total << "s" << std::endl;
	std::cout << "Status: " << response.status << std::endl;
	std::cout << "Headers:" << std::endl;
	for (const auto& h : response.headers.lines()) {
		std::cout << "  " << h << std::endl;
	}
	std::cout << "Body: " << std::endl << response.body << std::endl;
}

void testGET(retry_http::HttpClient& client, const std::string& base) {
	std::cout << "GET request..." << std::endl;

	// Continue the caller's correlation chain
	auto ctx = retry_http::withRequestId(retry_http::Context::background(), "example1234");
	printResult(client.get(ctx, base + "/get"));
}

void testPOST(retry_http::HttpClient& client, const std::string& base) {
	std::cout << "POST request..." << std::endl;

	std::string jsonBody = R"({"name":"test","value":"123"})";
	printResult(client.post(retry_http::Context::background(), base + "/post", "application/json", jsonBody));
}

void testPostForm(retry_http::HttpClient& client, const std::string& base) {
	std::cout << "POST form request..." << std::endl;

	retry_http::FormValues form{{"name", {"retry http"}}, {"tags", {"a", "b"}}};
	printResult(client.postForm(retry_http::Context::background(), base + "/post", form));
}

void testRetryOnServerError(const std::string& base) {
	std::cout << "GET with retries on 503..." << std::endl;

	// Three retries: 40ms, 80ms, 160ms minus jitter
	retry_http::HttpClient client(retry_http::ClientConfig().withMaxRetries(3).withTimeout(2s));
	auto started = std::chrono::steady_clock::now();
	auto result = client.get(retry_http::Context::background(), base + "/status/503");
	auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

	printResult(result);
	std::cout << "Gave up after " << elapsed.count() << "ms" << std::endl;
}

void testCancellation(const std::string& base) {
	std::cout << "GET cancelled after 300ms..." << std::endl;

	retry_http::HttpClient client(retry_http::ClientConfig().withTimeout(5s));
	auto [ctx, cancel] = retry_http::Context::withCancel(retry_http::Context::background());

	std::thread canceller([cancel = cancel]() {
		std::this_thread::sleep_for(300ms);
		cancel();
	});

	printResult(client.get(ctx, base + "/delay/3"));
	canceller.join();
}

void testDeadline(const std::string& base) {
	std::cout << "GET with a 500ms deadline..." << std::endl;

	retry_http::HttpClient client(retry_http::ClientConfig().withTimeout(5s));
	auto [ctx, cancel] = retry_http::Context::withTimeout(retry_http::Context::background(), 500ms);

	printResult(client.get(ctx, base + "/delay/3"));
	cancel();
}

int main(int argc, char** argv) {
	const std::string base = argc > 1 ? argv[1] : "https://httpbin.org";

	try {
		retry_http::Logger::inst().setLevel(retry_http::LogLevel::Debug);
		retry_http::HttpClient client(retry_http::loadConfigFromEnv());

		testGET(client, base);
		testPOST(client, base);
		testPostForm(client, base);
		testRetryOnServerError(base);
		testCancellation(base);
		testDeadline(base);
	} catch (const std::exception& e) {
		std::cerr << "Exception: " << e.what() << std::endl;
		return 1;
	}
	return 0;
}
