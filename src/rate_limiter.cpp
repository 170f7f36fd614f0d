#include "rate_limiter.hpp"

#include <iostream>
#include <stdexcept>

namespace calllog_purge {

SlidingWindowLimiter::SlidingWindowLimiter(Clock& clock,
                                           std::size_t requestsPerWindow,
                                           std::chrono::seconds window)
    : mClock(clock)
    , mRequestsPerWindow(requestsPerWindow)
    , mWindow(window)
{
    if (mRequestsPerWindow == 0) {
        throw std::invalid_argument("requestsPerWindow must be positive");
    }
    if (mWindow <= std::chrono::seconds::zero()) {
        throw std::invalid_argument("window must be positive");
    }
}

void SlidingWindowLimiter::pruneLocked(Clock::time_point now) {
    while (!mTimestamps.empty() && now - mTimestamps.front() >= mWindow) {
        mTimestamps.pop_front();
    }
}

void SlidingWindowLimiter::admit() {
    for (;;) {
        Clock::duration wait{};
        {
            std::lock_guard<std::mutex> lock(mMutex);
            const auto now = mClock.now();
            pruneLocked(now);

            if (mTimestamps.size() < mRequestsPerWindow) {
                mTimestamps.push_back(now);
                ++mAdmitted;
                return;
            }

            wait = mWindow - (now - mTimestamps.front());
            if (wait < Clock::duration::zero()) wait = Clock::duration::zero();
            mTotalWait += wait;
        }

        // Sleep outside the lock, then re-check: another caller may have
        // taken the slot freed by the oldest entry.
        std::cerr << "[RateLimiter] " << mRequestsPerWindow << " requests in the last "
                  << mWindow.count() << "s: sleeping "
                  << std::chrono::duration<double>(wait).count() << "s\n";
        mClock.sleepFor(wait);
    }
}

double SlidingWindowLimiter::totalWaitSeconds() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return std::chrono::duration<double>(mTotalWait).count();
}

int SlidingWindowLimiter::totalAdmitted() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mAdmitted;
}

std::size_t SlidingWindowLimiter::inWindow() {
    std::lock_guard<std::mutex> lock(mMutex);
    pruneLocked(mClock.now());
    return mTimestamps.size();
}

} // namespace calllog_purge
