/// @file test_util.cpp
/// Unit tests for util.hpp — URL handling, query building, backoff, timestamps.

#include "util.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace calllog_purge;
using std::chrono::seconds;

// ============================================================================
// parseUrl
// ============================================================================

TEST(ParseUrl, HttpWithPort) {
    auto parts = parseUrl("http://localhost:4000/restapi/v1.0/account/~/call-log");
    EXPECT_EQ(parts.scheme, "http");
    EXPECT_EQ(parts.host, "localhost");
    EXPECT_EQ(parts.port, "4000");
    EXPECT_EQ(parts.target, "/restapi/v1.0/account/~/call-log");
}

TEST(ParseUrl, HttpWithoutPortDefaultsTo80) {
    auto parts = parseUrl("http://example.com/api");
    EXPECT_EQ(parts.port, "80");
    EXPECT_EQ(parts.target, "/api");
}

TEST(ParseUrl, HttpsWithoutPortDefaultsTo443) {
    auto parts = parseUrl("https://platform.ringcentral.com");
    EXPECT_EQ(parts.scheme, "https");
    EXPECT_EQ(parts.host, "platform.ringcentral.com");
    EXPECT_EQ(parts.port, "443");
    EXPECT_EQ(parts.target, "/");
}

TEST(ParseUrl, QueryIsKeptInTarget) {
    auto parts = parseUrl("https://platform.example.com/restapi/v1.0/account/~/call-log?page=2&perPage=100");
    EXPECT_EQ(parts.target, "/restapi/v1.0/account/~/call-log?page=2&perPage=100");
}

TEST(ParseUrl, QueryDirectlyAfterHostGetsRootPath) {
    auto parts = parseUrl("http://example.com:8080?page=3");
    EXPECT_EQ(parts.host, "example.com");
    EXPECT_EQ(parts.port, "8080");
    EXPECT_EQ(parts.target, "/?page=3");
}

TEST(ParseUrl, MissingSchemeThrows) {
    EXPECT_THROW(parseUrl("localhost:4000/call-log"), std::invalid_argument);
}

TEST(ParseUrl, EmptyHostThrows) {
    EXPECT_THROW(parseUrl("http:///call-log"), std::invalid_argument);
}

// ============================================================================
// pathFromUri
// ============================================================================

TEST(PathFromUri, AbsoluteUriIsReducedToPathAndQuery) {
    EXPECT_EQ(pathFromUri("https://platform.example.com/restapi/v1.0/account/~/call-log?page=2"),
              "/restapi/v1.0/account/~/call-log?page=2");
}

TEST(PathFromUri, RelativeReferenceIsReturnedAsIs) {
    EXPECT_EQ(pathFromUri("/restapi/v1.0/account/~/call-log?page=2"),
              "/restapi/v1.0/account/~/call-log?page=2");
}

// ============================================================================
// urlEncode / buildTarget
// ============================================================================

TEST(UrlEncode, UnreservedCharactersPassThrough) {
    EXPECT_EQ(urlEncode("Simple-view_1.0~"), "Simple-view_1.0~");
}

TEST(UrlEncode, ReservedCharactersArePercentEncoded) {
    EXPECT_EQ(urlEncode("+15551234567"), "%2B15551234567");
    EXPECT_EQ(urlEncode("2025-11-01T00:00:00.000Z"), "2025-11-01T00%3A00%3A00.000Z");
    EXPECT_EQ(urlEncode("a b"), "a%20b");
}

TEST(BuildTarget, NoParamsLeavesPathUntouched) {
    EXPECT_EQ(buildTarget("/call-log", {}), "/call-log");
}

TEST(BuildTarget, ParamsAreAppendedInOrder) {
    EXPECT_EQ(buildTarget("/call-log", {{"view", "Simple"}, {"page", "1"}}),
              "/call-log?view=Simple&page=1");
}

TEST(BuildTarget, ExistingQueryIsExtended) {
    EXPECT_EQ(buildTarget("/call-log?page=2", {{"perPage", "100"}}),
              "/call-log?page=2&perPage=100");
}

// ============================================================================
// computeBackoff
// ============================================================================

TEST(ComputeBackoff, DoublesPerAttempt) {
    EXPECT_EQ(computeBackoff(1), seconds(2));
    EXPECT_EQ(computeBackoff(2), seconds(4));
    EXPECT_EQ(computeBackoff(3), seconds(8));
    EXPECT_EQ(computeBackoff(4), seconds(16));
}

TEST(ComputeBackoff, ClampsToThirtySeconds) {
    EXPECT_EQ(computeBackoff(5), seconds(30));
    EXPECT_EQ(computeBackoff(10), seconds(30));
    EXPECT_EQ(computeBackoff(200), seconds(30));
}

TEST(ComputeBackoff, CustomCeiling) {
    EXPECT_EQ(computeBackoff(3, 5), seconds(5));
    EXPECT_EQ(computeBackoff(2, 5), seconds(4));
}

// ============================================================================
// formatIsoUtc
// ============================================================================

TEST(FormatIsoUtc, Epoch) {
    EXPECT_EQ(formatIsoUtc(std::chrono::system_clock::time_point{}),
              "1970-01-01T00:00:00.000Z");
}

TEST(FormatIsoUtc, KeepsMilliseconds) {
    const auto tp = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(1700000000123LL));
    EXPECT_EQ(formatIsoUtc(tp), "2023-11-14T22:13:20.123Z");
}

TEST(IsoUtcDaysAgo, HasIsoShape) {
    const std::string s = isoUtcDaysAgo(30);
    ASSERT_EQ(s.size(), 24u);
    EXPECT_EQ(s[4], '-');
    EXPECT_EQ(s[10], 'T');
    EXPECT_EQ(s.back(), 'Z');
    EXPECT_LT(s, formatIsoUtc(std::chrono::system_clock::now()));
}
