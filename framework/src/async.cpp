#include <circuitguard/async.h>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace circuitguard {

Async<void> delay(std::chrono::milliseconds ms) {
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer timer(executor, ms);
    co_await timer.async_wait(boost::asio::use_awaitable);
}

} // namespace circuitguard
