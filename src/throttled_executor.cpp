#include "throttled_executor.hpp"
#include "errors.hpp"

#include <iostream>
#include <utility>

namespace calllog_purge {

namespace {

constexpr unsigned int kTooManyRequests = 429;
constexpr unsigned int kUnauthorized    = 401;

const char* kindName(AttemptOutcome::Kind kind) {
    switch (kind) {
    case AttemptOutcome::Kind::Success:          return "success";
    case AttemptOutcome::Kind::RateLimited:      return "rate limited";
    case AttemptOutcome::Kind::TransientFailure: return "transient failure";
    case AttemptOutcome::Kind::FatalFailure:     return "fatal failure";
    }
    return "unknown";
}

std::string describeCause(const AttemptOutcome& outcome) {
    if (!outcome.cause) {
        return "HTTP " + std::to_string(outcome.response.httpStatus);
    }
    try {
        std::rethrow_exception(outcome.cause);
    } catch (const std::exception& e) {
        return e.what();
    }
    return "unknown error";
}

} // namespace

ThrottledExecutor::ThrottledExecutor(SlidingWindowLimiter& limiter,
                                     Clock& clock,
                                     RetryPolicy policy,
                                     bool verbose)
    : mLimiter(limiter)
    , mClock(clock)
    , mPolicy(policy)
    , mVerbose(verbose) {}

ThrottledExecutor::Stats ThrottledExecutor::getStats() const {
    std::lock_guard<std::mutex> lock(mStatsMutex);
    return mStats;
}

AttemptOutcome ThrottledExecutor::classify(HttpResponse response) {
    if (response.ok()) {
        return AttemptOutcome::success(std::move(response));
    }
    if (response.httpStatus == kTooManyRequests) {
        return AttemptOutcome::rateLimited(std::move(response));
    }
    if (response.httpStatus == kUnauthorized) {
        return AttemptOutcome::fatal(std::move(response));
    }
    return AttemptOutcome::transient(std::move(response));
}

// ---------------------------------------------------------------------------
// One admitted attempt
// ---------------------------------------------------------------------------

AttemptOutcome ThrottledExecutor::attempt(const std::string& label,
                                          const RequestFn& requestFn)
{
    mLimiter.admit();
    {
        std::lock_guard<std::mutex> lock(mStatsMutex);
        ++mStats.totalRequests;
    }

    if (mVerbose) {
        std::cerr << "[Executor] " << label << "\n";
    }

    try {
        return classify(requestFn());
    } catch (const AuthenticationError&) {
        return AttemptOutcome::fatal(std::current_exception());
    } catch (const std::exception&) {
        // Resolve / connect / timeout: retryable.
        return AttemptOutcome::transient(std::current_exception());
    }
}

// ---------------------------------------------------------------------------
// Retry loop
// ---------------------------------------------------------------------------

HttpResponse ThrottledExecutor::execute(const std::string& label,
                                        const RequestFn& requestFn)
{
    RetryState state = mPolicy.start();

    for (;;) {
        AttemptOutcome outcome = attempt(label, requestFn);

        if (outcome.kind == AttemptOutcome::Kind::Success) {
            return std::move(outcome.response);
        }

        const RetryDecision decision = mPolicy.decide(outcome, state);
        {
            std::lock_guard<std::mutex> lock(mStatsMutex);
            if (outcome.kind == AttemptOutcome::Kind::RateLimited) {
                ++mStats.rateLimitedResponses;
            }
            if (decision.retry) {
                ++mStats.totalRetries;
                mStats.totalBackoffSeconds += static_cast<double>(decision.wait.count());
            } else {
                ++mStats.failedRequests;
            }
        }

        if (!decision.retry) {
            std::cerr << "[Executor] Giving up on " << label << " after "
                      << state.attempt << " attempt(s): "
                      << describeCause(outcome) << "\n";
            surface(label, outcome);
        }

        std::cerr << "[Retry] " << label << ": " << kindName(outcome.kind)
                  << " (" << describeCause(outcome) << ") attempt "
                  << state.attempt << "/" << state.maxRetries
                  << ", sleeping " << decision.wait.count() << "s\n";

        mClock.sleepFor(decision.wait);
    }
}

void ThrottledExecutor::surface(const std::string& label,
                                const AttemptOutcome& outcome)
{
    if (outcome.cause) {
        std::rethrow_exception(outcome.cause);
    }
    const auto& r = outcome.response;
    throw HttpError(r.httpStatus, label, r.retryAfter, r.rawBody);
}

} // namespace calllog_purge
