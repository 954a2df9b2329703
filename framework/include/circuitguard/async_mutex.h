#ifndef CIRCUITGUARD_ASYNC_MUTEX_H
#define CIRCUITGUARD_ASYNC_MUTEX_H

#include <circuitguard/async.h>
#include <boost/asio/steady_timer.hpp>
#include <deque>
#include <memory>
#include <mutex>
#include <stop_token>

namespace circuitguard {

/**
 * @brief Exclusive lock for coroutines.
 *
 * Contended callers park on a per-waiter timer and are handed ownership in
 * FIFO order. A waiter is woken through its own executor, so every coroutine
 * that may wait must run on a serialized executor (a single-threaded
 * io_context or a strand).
 */
class AsyncMutex {
public:
    AsyncMutex() = default;
    AsyncMutex(const AsyncMutex&) = delete;
    AsyncMutex& operator=(const AsyncMutex&) = delete;

    /**
     * @brief Acquires the lock, suspending while another holder has it.
     * @throws OperationCancelled if token is stopped before or while waiting.
     */
    Async<void> lock(std::stop_token token = {});

    bool try_lock();

    /**
     * @brief Passes ownership to the oldest waiter, or frees the lock.
     */
    void unlock();

    bool is_locked() const;

private:
    struct Waiter {
        explicit Waiter(const boost::asio::steady_timer::executor_type& ex)
            : timer(ex, std::chrono::steady_clock::time_point::max()) {}

        boost::asio::steady_timer timer;
        bool granted = false;
    };

    void wake(const std::shared_ptr<Waiter>& waiter);
    void cancel_waiter(const std::shared_ptr<Waiter>& waiter);
    void abandon(const std::shared_ptr<Waiter>& waiter);

    mutable std::mutex mutex_;
    bool locked_ = false;
    std::deque<std::shared_ptr<Waiter>> waiters_;
};

// Releases an AsyncMutex that is already held by the current coroutine.
class AsyncLockGuard {
    AsyncMutex& mutex_;
public:
    explicit AsyncLockGuard(AsyncMutex& m) : mutex_(m) {}
    ~AsyncLockGuard() { mutex_.unlock(); }

    AsyncLockGuard(const AsyncLockGuard&) = delete;
    AsyncLockGuard& operator=(const AsyncLockGuard&) = delete;
};

} // namespace circuitguard

#endif // CIRCUITGUARD_ASYNC_MUTEX_H
