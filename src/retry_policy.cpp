#include "retry_policy.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace calllog_purge {

// ---------------------------------------------------------------------------
// AttemptOutcome factories
// ---------------------------------------------------------------------------

AttemptOutcome AttemptOutcome::success(HttpResponse r) {
    AttemptOutcome o;
    o.kind     = Kind::Success;
    o.response = std::move(r);
    return o;
}

AttemptOutcome AttemptOutcome::rateLimited(HttpResponse r) {
    AttemptOutcome o;
    o.kind       = Kind::RateLimited;
    o.retryAfter = r.retryAfter;
    o.response   = std::move(r);
    return o;
}

AttemptOutcome AttemptOutcome::transient(HttpResponse r) {
    AttemptOutcome o;
    o.kind     = Kind::TransientFailure;
    o.response = std::move(r);
    return o;
}

AttemptOutcome AttemptOutcome::transient(std::exception_ptr e) {
    AttemptOutcome o;
    o.kind  = Kind::TransientFailure;
    o.cause = std::move(e);
    return o;
}

AttemptOutcome AttemptOutcome::fatal(HttpResponse r) {
    AttemptOutcome o;
    o.kind     = Kind::FatalFailure;
    o.response = std::move(r);
    return o;
}

AttemptOutcome AttemptOutcome::fatal(std::exception_ptr e) {
    AttemptOutcome o;
    o.kind  = Kind::FatalFailure;
    o.cause = std::move(e);
    return o;
}

// ---------------------------------------------------------------------------
// RetryPolicy
// ---------------------------------------------------------------------------

RetryPolicy::RetryPolicy(int maxRetries)
    : mMaxRetries(maxRetries)
{
    if (mMaxRetries < 0) {
        throw std::invalid_argument("maxRetries must not be negative");
    }
}

std::optional<std::chrono::seconds>
RetryPolicy::parseRetryAfter(const std::optional<std::string>& header) {
    if (!header) return std::nullopt;

    // Trim surrounding whitespace; the value must be all digits.
    const std::string& raw = *header;
    auto first = raw.find_first_not_of(" \t");
    if (first == std::string::npos) return std::nullopt;
    auto last = raw.find_last_not_of(" \t");
    const std::string value = raw.substr(first, last - first + 1);

    for (unsigned char c : value) {
        if (!std::isdigit(c)) return std::nullopt;
    }

    // Clamp before the value reaches Clock::duration (nanoseconds), where
    // anything above ~9.2e9 seconds would overflow.
    try {
        const long long secs = std::stoll(value);
        return std::min(std::chrono::seconds(secs), kMaxRetryAfter);
    } catch (const std::out_of_range&) {
        return kMaxRetryAfter;
    }
}

RetryDecision RetryPolicy::decide(const AttemptOutcome& outcome,
                                  RetryState& state) const
{
    RetryDecision decision;

    switch (outcome.kind) {
    case AttemptOutcome::Kind::Success:
    case AttemptOutcome::Kind::FatalFailure:
        return decision;

    case AttemptOutcome::Kind::RateLimited:
        ++state.attempt;
        decision.wait = parseRetryAfter(outcome.retryAfter)
                            .value_or(kDefaultRetryAfter);
        break;

    case AttemptOutcome::Kind::TransientFailure:
        ++state.attempt;
        decision.wait = computeBackoff(state.attempt, kMaxBackoffSeconds);
        break;
    }

    decision.retry = state.attempt <= state.maxRetries;
    if (!decision.retry) {
        decision.wait = std::chrono::seconds(0);
    }
    return decision;
}

} // namespace calllog_purge
