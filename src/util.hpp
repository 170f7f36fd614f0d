#pragma once

#include "transport.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace calllog_purge {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "8080", etc.
    std::string target;   // path + query (e.g. "/restapi/v1.0/account/~/call-log?page=2")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Path+query of an absolute URI; relative references are returned as-is.
std::string pathFromUri(const std::string& uri);

/// Percent-encode a query component (RFC 3986 unreserved set kept).
std::string urlEncode(const std::string& value);

/// Append @p params to @p path as a query string.
std::string buildTarget(const std::string& path, const QueryParams& params);

/// Exponential backoff: 2^attempt seconds, clamped to @p maxSeconds.
/// attempt is 1-based (first retry waits 2s).
std::chrono::seconds computeBackoff(int attempt, int64_t maxSeconds = 30);

/// "2025-11-01T00:00:00.000Z"
std::string formatIsoUtc(std::chrono::system_clock::time_point tp);

/// formatIsoUtc(now - days).
std::string isoUtcDaysAgo(int days);

} // namespace calllog_purge
