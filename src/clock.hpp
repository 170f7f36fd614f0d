#pragma once

#include <chrono>

namespace calllog_purge {

/// Time source + sleeper used by the limiter and the executor.
/// Injected so waits can be observed and skipped in tests.
class Clock {
public:
    using duration   = std::chrono::steady_clock::duration;
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    virtual time_point now() = 0;
    virtual void sleepFor(duration d) = 0;
};

/// std::chrono::steady_clock + std::this_thread::sleep_for.
class SteadyClock : public Clock {
public:
    time_point now() override;
    void sleepFor(duration d) override;
};

} // namespace calllog_purge
