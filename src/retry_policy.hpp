#pragma once

#include "transport.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>

namespace calllog_purge {

/// Result of one request attempt.
struct AttemptOutcome {
    enum class Kind {
        Success,
        RateLimited,        // HTTP 429
        TransientFailure,   // other HTTP error status, network error
        FatalFailure        // never retried
    };

    Kind                       kind = Kind::Success;
    HttpResponse               response;      // Success, or the failing response
    std::optional<std::string> retryAfter;    // RateLimited only, raw header value
    std::exception_ptr         cause;         // set for thrown failures

    static AttemptOutcome success(HttpResponse r);
    static AttemptOutcome rateLimited(HttpResponse r);
    static AttemptOutcome transient(HttpResponse r);
    static AttemptOutcome transient(std::exception_ptr e);
    static AttemptOutcome fatal(HttpResponse r);
    static AttemptOutcome fatal(std::exception_ptr e);
};

/// Attempts made so far for one logical request.
struct RetryState {
    int attempt    = 0;
    int maxRetries = 3;
};

struct RetryDecision {
    bool                 retry = false;
    std::chrono::seconds wait{0};
};

/// Decides whether a failed attempt is retried and how long to wait first.
///   429          -> Retry-After seconds (at most one day), or 60s when
///                   absent / unparseable
///   other errors -> min(2^attempt, 30)s
///   fatal        -> give up
class RetryPolicy {
public:
    static constexpr int                  kDefaultMaxRetries = 3;
    static constexpr std::chrono::seconds kDefaultRetryAfter{60};
    static constexpr std::chrono::seconds kMaxRetryAfter{24 * 60 * 60};
    static constexpr int64_t              kMaxBackoffSeconds = 30;

    explicit RetryPolicy(int maxRetries = kDefaultMaxRetries);

    RetryState start() const { return RetryState{0, mMaxRetries}; }

    /// Advances @p state.attempt for every retryable outcome.
    RetryDecision decide(const AttemptOutcome& outcome, RetryState& state) const;

    /// Seconds from a Retry-After value; nullopt unless a non-negative integer.
    /// Values above kMaxRetryAfter are clamped to it.
    static std::optional<std::chrono::seconds>
    parseRetryAfter(const std::optional<std::string>& header);

    int maxRetries() const { return mMaxRetries; }

private:
    int mMaxRetries;
};

} // namespace calllog_purge
