/// @file test_request_id.cpp
/// Unit tests for RequestId.hpp: id generation and the correlation chain.

#include "retry_http/RequestId.hpp"

#include <gtest/gtest.h>

#include <cctype>
#include <set>

using namespace retry_http;

namespace {

bool isAlnum(const std::string& s) {
    for (unsigned char c : s) {
        if (!std::isalnum(c)) {
            return false;
        }
    }
    return true;
}

} // namespace

// ============================================================================
// newRequestId
// ============================================================================

TEST(NewRequestId, HasRequestedLengthAndAlphabet) {
    for (size_t len : {1u, 4u, 20u, 64u, 300u}) {
        std::string id = newRequestId(len);
        EXPECT_EQ(id.size(), len);
        EXPECT_TRUE(isAlnum(id)) << id;
    }
}

TEST(NewRequestId, ZeroLengthIsEmpty) {
    EXPECT_TRUE(newRequestId(0).empty());
}

TEST(NewRequestId, IdsDiffer) {
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        seen.insert(newRequestId(kDefaultRequestIdLength));
    }
    EXPECT_EQ(seen.size(), 200u);
}

// ============================================================================
// buildRequestId
// ============================================================================

TEST(BuildRequestId, FreshIdWithoutUpstream) {
    std::string id = buildRequestId("");
    EXPECT_EQ(id.size(), 20u);
    EXPECT_TRUE(isAlnum(id));
}

TEST(BuildRequestId, AppendsHalfLengthSegment) {
    std::string id = buildRequestId("call1234");
    ASSERT_EQ(id.rfind("call1234,", 0), 0u) << id;
    EXPECT_EQ(id.size(), 8u + 1u + 4u);
    EXPECT_GT(id.size(), 12u);
    EXPECT_TRUE(isAlnum(id.substr(9)));
}

TEST(BuildRequestId, UsesFirstSegmentOfExistingChain) {
    std::string upstream = "abcdefghij,klmno";
    std::string id = buildRequestId(upstream);
    ASSERT_EQ(id.rfind(upstream + ",", 0), 0u) << id;
    EXPECT_EQ(id.size() - upstream.size() - 1, 5u);
}

TEST(BuildRequestId, EarlyCommaFallsBackToWholeLength) {
    std::string id = buildRequestId(",abcdefg");
    EXPECT_EQ(id.size() - 8 - 1, 4u);

    id = buildRequestId("a,bcdefghi");
    EXPECT_EQ(id.size() - 10 - 1, 5u);
}

TEST(BuildRequestId, OneCharacterUpstreamGetsEmptySegment) {
    EXPECT_EQ(buildRequestId("x"), "x,");
}

TEST(BuildRequestId, ChainGrowsPerHop) {
    std::string hop1 = buildRequestId("");
    std::string hop2 = buildRequestId(hop1);
    std::string hop3 = buildRequestId(hop2);

    EXPECT_EQ(hop2.size(), 20u + 1u + 10u);
    EXPECT_EQ(hop3.size(), hop2.size() + 1u + 10u);
    EXPECT_EQ(hop3.rfind(hop2, 0), 0u);
}

TEST(BuildRequestId, SameUpstreamSameShape) {
    std::string a = buildRequestId("upstream-id-000");
    std::string b = buildRequestId("upstream-id-000");
    EXPECT_EQ(a.size(), b.size());
}

// ============================================================================
// Headers
// ============================================================================

TEST(CorrelationHeaders, SetsFreshRequestId) {
    HttpRequest request("GET", "http://example.test/");
    addCorrelationHeaders(Context::background(), request);
    EXPECT_EQ(request.headers.get(kRequestIdHeader).size(), 20u);
    EXPECT_FALSE(request.headers.has(kUserIdentityHeader));
}

TEST(CorrelationHeaders, ExtendsContextChain) {
    Context ctx = withRequestId(Context::background(), "call1234");
    EXPECT_EQ(getRequestId(ctx), "call1234");

    HttpRequest request("GET", "http://example.test/");
    addCorrelationHeaders(ctx, request);
    std::string id = request.headers.get(kRequestIdHeader);
    EXPECT_EQ(id.rfind("call1234,", 0), 0u);
    EXPECT_EQ(id.size(), 13u);
}

TEST(CorrelationHeaders, ReplacesCallerRequestId) {
    HttpRequest request("GET", "http://example.test/");
    request.headers.set("x-request-id", "caller-set");
    addCorrelationHeaders(Context::background(), request);
    EXPECT_EQ(request.headers.values(kRequestIdHeader).size(), 1u);
    EXPECT_NE(request.headers.get(kRequestIdHeader), "caller-set");
}

TEST(CorrelationHeaders, ForwardsUser) {
    Context ctx = withUser(Context::background(), "alice");
    EXPECT_EQ(getUser(ctx), "alice");

    HttpRequest request("GET", "http://example.test/");
    addCorrelationHeaders(ctx, request);
    EXPECT_EQ(request.headers.get(kUserIdentityHeader), "alice");
}

TEST(CorrelationHeaders, KeepsExplicitUser) {
    Context ctx = withUser(Context::background(), "alice");
    HttpRequest request("GET", "http://example.test/");
    request.headers.set(kUserIdentityHeader, "bob");
    addCorrelationHeaders(ctx, request);
    EXPECT_EQ(request.headers.get(kUserIdentityHeader), "bob");
}

TEST(CorrelationHeaders, EmptyUserIsNotSent) {
    Context ctx = withUser(Context::background(), "");
    HttpRequest request("GET", "http://example.test/");
    addCorrelationHeaders(ctx, request);
    EXPECT_FALSE(request.headers.has(kUserIdentityHeader));
}
