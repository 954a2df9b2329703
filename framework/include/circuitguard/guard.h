#ifndef CIRCUITGUARD_GUARD_H
#define CIRCUITGUARD_GUARD_H

#include <circuitguard/async.h>
#include <circuitguard/async_mutex.h>
#include <circuitguard/logger.h>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace circuitguard {

enum class State {
    Closed,   // Calls pass through
    Open,     // Calls are rejected until the cooldown elapses
    HalfOpen  // One probe call decides between Closed and Open
};

std::string_view to_string(State state);

struct GuardConfig {
    int threshold = 5;                              // Consecutive failures that trip the circuit
    std::chrono::milliseconds timeout{30000};       // Cooldown before a probe is allowed
    std::string name = "default";                   // Prefix for log lines
    std::function<std::chrono::steady_clock::time_point()> clock;  // Empty = steady_clock::now

    /**
     * @brief Reads <PREFIX>_THRESHOLD and <PREFIX>_TIMEOUT_MS from the environment.
     * Missing variables fall back to the defaults above.
     */
    static GuardConfig from_env(const std::string& prefix);
};

/**
 * @brief Circuit breaker around calls to an unreliable dependency.
 *
 * Every call to execute() holds an exclusive lock for the whole evaluation:
 * state check, the protected operation itself, and the resulting transition.
 * At most one operation runs through a Guard at a time, and there is never
 * more than one Half-Open probe in flight.
 *
 * usage:
 *   Guard guard(3, std::chrono::seconds(10), &Logger::instance());
 *   auto body = co_await guard.execute([&]() -> Async<std::string> {
 *       co_return co_await client.get("/health");
 *   }, stop_source.get_token());
 */
class Guard {
public:
    using Operation = std::function<Async<void>()>;
    using Listener = std::function<void()>;
    using ListenerId = std::size_t;

    /**
     * @throws std::invalid_argument if threshold < 1 or timeout <= 0.
     */
    explicit Guard(GuardConfig config, LogSink* logger = nullptr);
    Guard(int threshold, std::chrono::milliseconds timeout, LogSink* logger = nullptr);

    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;

    /**
     * @brief Runs operation under circuit protection.
     *
     * For an operation returning Async<void> this yields Async<void>; for
     * Async<T> it yields Async<std::optional<T>>, empty only when the
     * operation was cancelled through token.
     *
     * @throws CircuitOpenError while Open and cooling down. The operation is
     *         not invoked.
     * @throws OperationCancelled if token is stopped before the lock is acquired,
     *         or if the operation raises a cancellation for a different token.
     * Any error raised by the operation itself is recorded, then rethrown as is.
     */
    template <typename F>
    auto execute(F operation, std::stop_token token = {}) {
        using Info = extract_async_type<std::invoke_result_t<F&>>;
        static_assert(Info::is_async, "Guard::execute expects a callable returning Async<T>");

        if constexpr (std::is_void_v<typename Info::type>) {
            return run(Operation(std::move(operation)), std::move(token));
        } else {
            return execute_value<typename Info::type>(std::move(operation), std::move(token));
        }
    }

    /** @brief Current state. Lock-free, may trail an in-flight transition. */
    State state() const { return state_.load(std::memory_order_acquire); }

    int failure_count() const { return failure_count_.load(std::memory_order_acquire); }
    int threshold() const { return threshold_; }
    std::chrono::milliseconds timeout() const { return timeout_; }
    const std::string& name() const { return name_; }

    /**
     * @brief Registers a callback fired once per actual state change.
     * Callbacks run inside the guard's critical section and must not block.
     * Anything a callback throws is logged and dropped, so the caller always
     * sees the outcome of its own operation.
     * Query state() from the callback for the new value.
     */
    ListenerId on_state_change(Listener listener);

    bool remove_listener(ListenerId id);

private:
    template <typename T, typename F>
    Async<std::optional<T>> execute_value(F operation, std::stop_token token) {
        std::optional<T> result;
        co_await run([&]() -> Async<void> {
            result.emplace(co_await operation());
        }, std::move(token));
        co_return result;
    }

    Async<void> run(Operation operation, std::stop_token token);
    Async<void> attempt(Operation& operation, const std::stop_token& token, State entered);

    void reset();
    void record_failure();
    void trip();
    void transition(State next);
    void log(LogLevel level, std::string_view message);
    std::chrono::steady_clock::time_point now() const;

    const int threshold_;
    const std::chrono::milliseconds timeout_;
    const std::string name_;
    const std::function<std::chrono::steady_clock::time_point()> clock_;
    LogSink* logger_;

    std::atomic<State> state_{State::Closed};
    std::atomic<int> failure_count_{0};
    std::chrono::steady_clock::time_point last_failure_time_{};
    AsyncMutex lock_;

    std::mutex listeners_mutex_;
    std::vector<std::pair<ListenerId, Listener>> listeners_;
    ListenerId next_listener_id_ = 1;
};

} // namespace circuitguard

#endif // CIRCUITGUARD_GUARD_H
