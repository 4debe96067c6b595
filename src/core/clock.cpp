#include <nimbus/core/clock.h>

#include <utility>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace nimbus {

TimePoint SystemClock::now() const {
    return SteadyClock::now();
}

boost::asio::awaitable<void> SystemClock::sleepFor(SteadyClock::duration d) {
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    timer.expires_after(d);
    co_await timer.async_wait(boost::asio::use_awaitable);
}

} // namespace nimbus
