#include "clock.hpp"

#include <thread>

namespace calllog_purge {

Clock::time_point SteadyClock::now() {
    return std::chrono::steady_clock::now();
}

void SteadyClock::sleepFor(duration d) {
    if (d > duration::zero()) {
        std::this_thread::sleep_for(d);
    }
}

} // namespace calllog_purge
