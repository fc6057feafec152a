/// @file test_backoff.cpp
/// Unit tests for Backoff.hpp: delay computation and the retry loop.

#include "retry_http/Backoff.hpp"
#include "retry_http/errors.hpp"

#include "fake_transport.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace retry_http;
using namespace std::chrono_literals;
using retry_http::testing::FakeTransport;
using retry_http::testing::makeResponse;

namespace {

using Clock = std::chrono::steady_clock;

long long elapsedMs(Clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since).count();
}

SendFn countingSender(int& calls) {
    return [&calls](const Context& ctx, Transport& transport, HttpRequest& request) {
        ++calls;
        return transport.perform(ctx, request, nullptr);
    };
}

} // namespace

// ============================================================================
// sleepTime
// ============================================================================

TEST(SleepTime, WithinJitterWindow) {
    for (uint32_t n = 1; n <= 10; ++n) {
        for (auto base : {1ms, 5ms, 20ms, 100ms}) {
            const long long nominal = (1LL << n) * base.count();
            for (int i = 0; i < 50; ++i) {
                auto d = retry::sleepTime(n, base).count();
                EXPECT_GE(d, std::max(0LL, nominal - 4)) << "n=" << n << " base=" << base.count();
                EXPECT_LE(d, std::max(0LL, nominal - 1)) << "n=" << n << " base=" << base.count();
            }
        }
    }
}

TEST(SleepTime, DeterministicFormula) {
    EXPECT_EQ(retry::sleepTime(1, 20ms, 1), 39ms);
    EXPECT_EQ(retry::sleepTime(2, 20ms, 4), 76ms);
    EXPECT_EQ(retry::sleepTime(3, 20ms, 2), 158ms);
    EXPECT_EQ(retry::sleepTime(10, 20ms, 3), 20477ms);
}

TEST(SleepTime, MonotonicForFixedJitter) {
    for (int64_t jitter = retry::kJitterMinMs; jitter <= retry::kJitterMaxMs; ++jitter) {
        auto prev = retry::sleepTime(1, 20ms, jitter);
        for (uint32_t n = 2; n <= 80; ++n) {
            auto cur = retry::sleepTime(n, 20ms, jitter);
            EXPECT_GE(cur, prev) << "n=" << n;
            prev = cur;
        }
    }
}

TEST(SleepTime, NeverNegative) {
    EXPECT_EQ(retry::sleepTime(1, 1ms, 4), 0ms);
    EXPECT_EQ(retry::sleepTime(1, 0ms, 1), 0ms);
    EXPECT_EQ(retry::sleepTime(0, 1ms, 4), 0ms);
    for (int i = 0; i < 100; ++i) {
        EXPECT_GE(retry::sleepTime(1, 1ms).count(), 0);
    }
}

TEST(SleepTime, SaturatesForLargeAttempts) {
    EXPECT_LE(retry::sleepTime(63, 20ms, 1), retry::kMaxSleepTime);
    EXPECT_LE(retry::sleepTime(1000, 20ms, 1), retry::kMaxSleepTime);
    EXPECT_GT(retry::sleepTime(1000, 20ms, 1), 0ms);
}

// ============================================================================
// backoff loop
// ============================================================================

TEST(Backoff, ExhaustionReturnsLastOutcomeVerbatim) {
    FakeTransport transport({Result::fromResponse(makeResponse(500, "last"))});
    HttpRequest request("GET", "http://example.test/");
    int calls = 0;

    Result r = retry::backoff(Context::background(), 3, 1ms, countingSender(calls), transport, request,
                              Result::fromResponse(makeResponse(500, "first")));

    EXPECT_EQ(calls, 3);
    ASSERT_TRUE(r.response.has_value());
    EXPECT_FALSE(r.error);
    EXPECT_EQ(r.response->status, 500);
    EXPECT_EQ(r.response->body, "last");
}

TEST(Backoff, ExhaustionCanEndOnTransportError) {
    FakeTransport transport({Result::fromError(make_error_code(CURLE_COULDNT_CONNECT))});
    HttpRequest request("GET", "http://example.test/");
    int calls = 0;

    Result r = retry::backoff(Context::background(), 2, 1ms, countingSender(calls), transport, request,
                              Result::fromError(make_error_code(CURLE_COULDNT_CONNECT)));

    EXPECT_EQ(calls, 2);
    EXPECT_FALSE(r.response.has_value());
    EXPECT_EQ(r.error, make_error_code(CURLE_COULDNT_CONNECT));
}

TEST(Backoff, StopsAtFirstFinalOutcome) {
    FakeTransport transport({
        Result::fromResponse(makeResponse(503)),
        Result::fromResponse(makeResponse(404)),
        Result::fromResponse(makeResponse(200)),
    });
    HttpRequest request("GET", "http://example.test/");
    int calls = 0;

    Result r = retry::backoff(Context::background(), 10, 1ms, countingSender(calls), transport, request,
                              Result::fromResponse(makeResponse(503)));

    EXPECT_EQ(calls, 2);
    ASSERT_TRUE(r.response.has_value());
    EXPECT_EQ(r.response->status, 404);
}

TEST(Backoff, ZeroRetriesReturnsFirstOutcome) {
    FakeTransport transport({Result::fromResponse(makeResponse(200))});
    HttpRequest request("GET", "http://example.test/");
    int calls = 0;

    Result r = retry::backoff(Context::background(), 0, 1ms, countingSender(calls), transport, request,
                              Result::fromResponse(makeResponse(502)));

    EXPECT_EQ(calls, 0);
    ASSERT_TRUE(r.response.has_value());
    EXPECT_EQ(r.response->status, 502);
}

TEST(Backoff, CancellationInterruptsSleep) {
    FakeTransport transport({Result::fromResponse(makeResponse(500))});
    HttpRequest request("GET", "http://example.test/");
    int calls = 0;

    auto [ctx, cancel] = Context::withCancel(Context::background());
    std::thread canceller([cancel = cancel]() {
        std::this_thread::sleep_for(50ms);
        cancel();
    });

    // First sleep would be ~20s
    auto started = Clock::now();
    Result r = retry::backoff(ctx, 5, 10s, countingSender(calls), transport, request,
                              Result::fromResponse(makeResponse(500)));
    canceller.join();

    EXPECT_LT(elapsedMs(started), 5000);
    EXPECT_EQ(calls, 0);
    EXPECT_FALSE(r.response.has_value());
    EXPECT_EQ(r.error, make_error_code(context_errc::canceled));
    EXPECT_EQ(r.error.message(), "context canceled");
}

TEST(Backoff, DeadlineInterruptsSleep) {
    FakeTransport transport({Result::fromResponse(makeResponse(500))});
    HttpRequest request("GET", "http://example.test/");
    int calls = 0;

    auto [ctx, cancel] = Context::withTimeout(Context::background(), 50ms);
    auto started = Clock::now();
    Result r = retry::backoff(ctx, 5, 10s, countingSender(calls), transport, request,
                              Result::fromResponse(makeResponse(500)));
    cancel();

    EXPECT_LT(elapsedMs(started), 5000);
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(r.error, make_error_code(context_errc::deadline_exceeded));
    EXPECT_EQ(r.error.message(), "context deadline exceeded");
}

TEST(Backoff, CancellationDuringSendWinsOverResponse) {
    FakeTransport transport({Result::fromResponse(makeResponse(200))});
    HttpRequest request("GET", "http://example.test/");
    int calls = 0;

    auto [ctx, cancel] = Context::withCancel(Context::background());
    transport.onPerform([cancel = cancel](int) { cancel(); });

    Result r = retry::backoff(ctx, 5, 1ms, countingSender(calls), transport, request,
                              Result::fromResponse(makeResponse(500)));

    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(r.response.has_value());
    EXPECT_EQ(r.error, make_error_code(context_errc::canceled));
}

TEST(Backoff, AlreadyCancelledContextSendsNothing) {
    FakeTransport transport({Result::fromResponse(makeResponse(200))});
    HttpRequest request("GET", "http://example.test/");
    int calls = 0;

    auto [ctx, cancel] = Context::withCancel(Context::background());
    cancel();

    Result r = retry::backoff(ctx, 5, 1ms, countingSender(calls), transport, request,
                              Result::fromResponse(makeResponse(500)));

    EXPECT_EQ(calls, 0);
    EXPECT_EQ(r.error, make_error_code(context_errc::canceled));
}
