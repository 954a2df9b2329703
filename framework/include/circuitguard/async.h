#ifndef CIRCUITGUARD_ASYNC_H
#define CIRCUITGUARD_ASYNC_H

#include <chrono>
#include <utility>
#include <boost/asio/awaitable.hpp>

namespace circuitguard {

template <typename T = void>
using Async = boost::asio::awaitable<T>;

template<typename T>
struct extract_async_type {
    using type = void;
    static constexpr bool is_async = false;
};

template<typename T>
struct extract_async_type<boost::asio::awaitable<T>> {
    using type = T;
    static constexpr bool is_async = true;
};

/**
 * @brief Asynchronously waits for a specified duration.
 * usage: co_await circuitguard::delay(std::chrono::milliseconds(1000));
 */
Async<void> delay(std::chrono::milliseconds ms);

} // namespace circuitguard

#endif // CIRCUITGUARD_ASYNC_H
