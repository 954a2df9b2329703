#include <circuitguard/async_mutex.h>
#include <circuitguard/cancellation.h>
#include <boost/asio/post.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <algorithm>

namespace circuitguard {

Async<void> AsyncMutex::lock(std::stop_token token) {
    throw_if_cancelled(token);

    auto executor = co_await boost::asio::this_coro::executor;
    std::shared_ptr<Waiter> waiter;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!locked_) {
            locked_ = true;
            co_return;
        }

        // Lock is held, add to wait list
        waiter = std::make_shared<Waiter>(executor);
        waiters_.push_back(waiter);
    }

    std::stop_callback on_stop(token, [this, waiter] { cancel_waiter(waiter); });

    try {
        co_await waiter->timer.async_wait(boost::asio::use_awaitable);
    } catch (const boost::system::system_error& e) {
        if (e.code() != boost::asio::error::operation_aborted) {
            abandon(waiter);
            throw; // Real error
        }
        // Aborted means we were woken up
    }

    bool granted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        granted = waiter->granted;
    }
    if (!granted) {
        throw OperationCancelled(token);
    }
}

bool AsyncMutex::try_lock() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (locked_) return false;
    locked_ = true;
    return true;
}

void AsyncMutex::unlock() {
    std::shared_ptr<Waiter> next;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (waiters_.empty()) {
            locked_ = false;
            return;
        }
        next = waiters_.front();
        waiters_.pop_front();
        next->granted = true;
    }
    wake(next);
}

bool AsyncMutex::is_locked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locked_;
}

void AsyncMutex::wake(const std::shared_ptr<Waiter>& waiter) {
    // Moving the expiry into the past also covers a wait that is not
    // pending yet.
    boost::asio::post(waiter->timer.get_executor(), [waiter] {
        waiter->timer.expires_at(std::chrono::steady_clock::time_point::min());
    });
}

void AsyncMutex::cancel_waiter(const std::shared_ptr<Waiter>& waiter) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find(waiters_.begin(), waiters_.end(), waiter);
        if (it == waiters_.end()) return; // Already granted
        waiters_.erase(it);
    }
    wake(waiter);
}

void AsyncMutex::abandon(const std::shared_ptr<Waiter>& waiter) {
    bool owned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        owned = waiter->granted;
        if (!owned) {
            auto it = std::find(waiters_.begin(), waiters_.end(), waiter);
            if (it != waiters_.end()) waiters_.erase(it);
        }
    }
    if (owned) unlock();
}

} // namespace circuitguard
