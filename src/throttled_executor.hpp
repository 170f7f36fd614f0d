#pragma once

#include "clock.hpp"
#include "rate_limiter.hpp"
#include "retry_policy.hpp"
#include "transport.hpp"

#include <functional>
#include <mutex>
#include <string>

namespace calllog_purge {

/// Wraps a single logical request in sliding-window admission and the
/// retry policy. Shared by the page walker and the delete workflow;
/// execute() may be called from several threads.
class ThrottledExecutor {
public:
    using RequestFn = std::function<HttpResponse()>;

    struct Stats {
        int    totalRequests        = 0;   // attempts actually sent
        int    totalRetries         = 0;
        int    rateLimitedResponses = 0;
        int    failedRequests       = 0;   // logical requests that gave up
        double totalBackoffSeconds  = 0.0;
    };

    ThrottledExecutor(SlidingWindowLimiter& limiter,
                      Clock& clock,
                      RetryPolicy policy = RetryPolicy{},
                      bool verbose = false);

    /// Run @p requestFn until it returns a 2xx response or the policy gives up.
    /// @param label  Shown in diagnostics and carried by HttpError::target.
    /// @throws HttpError for a terminal error status; rethrows the last
    ///         exception for terminal transport failures.
    HttpResponse execute(const std::string& label, const RequestFn& requestFn);

    /// 2xx -> Success, 429 -> RateLimited, 401 -> FatalFailure,
    /// anything else -> TransientFailure.
    static AttemptOutcome classify(HttpResponse response);

    Stats getStats() const;
    const RetryPolicy& policy() const { return mPolicy; }

private:
    SlidingWindowLimiter& mLimiter;
    Clock&                mClock;
    RetryPolicy           mPolicy;
    bool                  mVerbose;

    mutable std::mutex    mStatsMutex;
    Stats                 mStats{};

    AttemptOutcome attempt(const std::string& label, const RequestFn& requestFn);

    [[noreturn]] static void surface(const std::string& label,
                                     const AttemptOutcome& outcome);
};

} // namespace calllog_purge
