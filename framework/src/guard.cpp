#include <circuitguard/guard.h>
#include <circuitguard/cancellation.h>
#include <circuitguard/environment.h>
#include <circuitguard/exceptions.h>
#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>
#include <algorithm>
#include <exception>
#include <stdexcept>

namespace circuitguard {

std::string_view to_string(State state) {
    switch (state) {
        case State::Closed:   return "Closed";
        case State::Open:     return "Open";
        case State::HalfOpen: return "HalfOpen";
    }
    return "Unknown";
}

GuardConfig GuardConfig::from_env(const std::string& prefix) {
    GuardConfig config;
    config.threshold = env<int>(prefix + "_THRESHOLD", 5);
    config.timeout = env<std::chrono::milliseconds>(prefix + "_TIMEOUT_MS", std::chrono::milliseconds(30000));
    config.name = prefix;
    return config;
}

Guard::Guard(GuardConfig config, LogSink* logger)
    : threshold_(config.threshold),
      timeout_(config.timeout),
      name_(std::move(config.name)),
      clock_(std::move(config.clock)),
      logger_(logger) {
    if (threshold_ < 1) {
        throw std::invalid_argument("Guard threshold must be at least 1");
    }
    if (timeout_ <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Guard timeout must be positive");
    }
}

Guard::Guard(int threshold, std::chrono::milliseconds timeout, LogSink* logger)
    : Guard(GuardConfig{.threshold = threshold, .timeout = timeout}, logger) {}

Async<void> Guard::run(Operation operation, std::stop_token token) {
    co_await lock_.lock(token);
    AsyncLockGuard hold(lock_);

    switch (state_.load(std::memory_order_acquire)) {
        case State::Closed:
            co_await attempt(operation, token, State::Closed);
            break;

        case State::Open: {
            auto elapsed = now() - last_failure_time_;
            if (elapsed < timeout_) {
                auto retry_after = std::chrono::ceil<std::chrono::milliseconds>(timeout_ - elapsed);
                log(LogLevel::INFO, "call rejected, circuit is open");
                throw CircuitOpenError(retry_after);
            }
            // Cooldown over: this call becomes the probe
            state_.store(State::HalfOpen, std::memory_order_release);
            co_await attempt(operation, token, State::HalfOpen);
            break;
        }

        case State::HalfOpen:
            co_await attempt(operation, token, State::HalfOpen);
            break;

        default:
            throw std::logic_error("Invalid state in circuit guard '" + name_ + "'");
    }
}

Async<void> Guard::attempt(Operation& operation, const std::stop_token& token, State entered) {
    std::exception_ptr failure;
    std::string reason;
    bool cancelled = false;

    try {
        throw_if_cancelled(token);
        co_await operation();
    } catch (const OperationCancelled& e) {
        if (!is_cancelled_by(e, token)) {
            throw; // Not ours to absorb
        }
        cancelled = true;
    } catch (const boost::system::system_error& e) {
        if (e.code() == boost::asio::error::operation_aborted) {
            throw;
        }
        failure = std::current_exception();
        reason = e.what();
    } catch (const std::exception& e) {
        failure = std::current_exception();
        reason = e.what();
    } catch (...) {
        failure = std::current_exception();
        reason = "unknown error";
    }

    if (cancelled) {
        log(LogLevel::INFO, "operation was cancelled");
        co_return;
    }

    if (!failure) {
        reset();
        co_return;
    }

    if (entered == State::HalfOpen) {
        log(LogLevel::ERROR, "probe failed in half-open state: " + reason);
        record_failure();
        trip();
    } else {
        log(LogLevel::ERROR, "operation failed in closed state: " + reason);
        record_failure();
        if (failure_count_.load(std::memory_order_acquire) >= threshold_) {
            trip();
        }
    }

    std::rethrow_exception(failure);
}

void Guard::reset() {
    failure_count_.store(0, std::memory_order_release);
    if (state_.load(std::memory_order_acquire) == State::Closed) return;
    transition(State::Closed);
}

void Guard::record_failure() {
    failure_count_.fetch_add(1, std::memory_order_acq_rel);
    last_failure_time_ = now();
}

void Guard::trip() {
    if (state_.load(std::memory_order_acquire) == State::Open) return;
    transition(State::Open);
}

void Guard::transition(State next) {
    state_.store(next, std::memory_order_release);
    log(LogLevel::INFO, "circuit state changed to " + std::string(to_string(next)));

    std::vector<Listener> snapshot;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        snapshot.reserve(listeners_.size());
        for (const auto& entry : listeners_) {
            snapshot.push_back(entry.second);
        }
    }

    for (const auto& listener : snapshot) {
        try {
            listener();
        } catch (const std::exception& e) {
            log(LogLevel::ERROR, std::string("state change listener failed: ") + e.what());
        } catch (...) {
            log(LogLevel::ERROR, "state change listener failed: unknown exception");
        }
    }
}

Guard::ListenerId Guard::on_state_change(Listener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    ListenerId id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

bool Guard::remove_listener(ListenerId id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    auto it = std::find_if(listeners_.begin(), listeners_.end(),
                           [id](const auto& entry) { return entry.first == id; });
    if (it == listeners_.end()) return false;
    listeners_.erase(it);
    return true;
}

void Guard::log(LogLevel level, std::string_view message) {
    if (!logger_) return;
    logger_->log(level, "[" + name_ + "] " + std::string(message));
}

std::chrono::steady_clock::time_point Guard::now() const {
    return clock_ ? clock_() : std::chrono::steady_clock::now();
}

} // namespace circuitguard
