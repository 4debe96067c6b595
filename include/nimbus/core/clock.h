#pragma once

#include <nimbus/core/types.h>

#include <utility>
#include <boost/asio/awaitable.hpp>

namespace nimbus {

// Time source for every polling loop, retry delay and wait tick. Components
// never read std::chrono clocks directly so that tests can drive time.
class Clock {
public:
    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;

    // Suspends the calling coroutine for `d`.
    virtual boost::asio::awaitable<void> sleepFor(SteadyClock::duration d) = 0;
};

// Production clock: std::chrono::steady_clock plus asio steady_timer waits
// on the awaiting coroutine's executor.
class SystemClock final : public Clock {
public:
    TimePoint now() const override;
    boost::asio::awaitable<void> sleepFor(SteadyClock::duration d) override;
};

} // namespace nimbus
