#pragma once

#include "clock.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>

namespace calllog_purge {

/// Client-side admission control: at most N requests per trailing window.
/// One instance represents the account-wide quota and is shared by every
/// component that sends requests.
class SlidingWindowLimiter {
public:
    static constexpr std::size_t kDefaultRequestsPerWindow = 10;
    static constexpr std::chrono::seconds kDefaultWindow{60};

    explicit SlidingWindowLimiter(Clock& clock,
                                  std::size_t requestsPerWindow = kDefaultRequestsPerWindow,
                                  std::chrono::seconds window = kDefaultWindow);

    /// Block until a slot is free, then record the admission.
    void admit();

    // ---- accessors for summary report ----
    double      totalWaitSeconds() const;
    int         totalAdmitted()    const;
    std::size_t inWindow();

    std::size_t          requestsPerWindow() const { return mRequestsPerWindow; }
    std::chrono::seconds window()            const { return mWindow; }

private:
    Clock&               mClock;
    std::size_t          mRequestsPerWindow;
    std::chrono::seconds mWindow;

    mutable std::mutex             mMutex;
    std::deque<Clock::time_point>  mTimestamps;   // oldest first
    Clock::duration                mTotalWait{};
    int                            mAdmitted = 0;

    void pruneLocked(Clock::time_point now);
};

} // namespace calllog_purge
