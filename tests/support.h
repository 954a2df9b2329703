#ifndef CIRCUITGUARD_TESTS_SUPPORT_H
#define CIRCUITGUARD_TESTS_SUPPORT_H

#include <circuitguard/async.h>
#include <circuitguard/logger.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace test_support {

// Drives a coroutine to completion and returns (or rethrows) its outcome.
template <typename T>
T run_sync(boost::asio::io_context& ioc, circuitguard::Async<T> task) {
    auto result = boost::asio::co_spawn(ioc, std::move(task), boost::asio::use_future);
    ioc.restart();
    ioc.run();
    return result.get();
}

// Error type standing in for a failing remote dependency.
class DependencyError : public std::runtime_error {
public:
    explicit DependencyError(const std::string& msg = "dependency failed") : std::runtime_error(msg) {}
};

// Steady clock the test moves by hand.
class ManualClock {
    std::shared_ptr<std::chrono::steady_clock::time_point> now_ =
        std::make_shared<std::chrono::steady_clock::time_point>(std::chrono::steady_clock::now());
public:
    void advance(std::chrono::milliseconds d) { *now_ += d; }

    std::function<std::chrono::steady_clock::time_point()> source() const {
        auto now = now_;
        return [now] { return *now; };
    }
};

// Records everything a Guard logs.
class SpySink : public circuitguard::LogSink {
public:
    struct Entry {
        circuitguard::LogLevel level;
        std::string message;
    };

    void log(circuitguard::LogLevel level, std::string_view message) override {
        std::lock_guard<std::mutex> lock(mtx_);
        entries_.push_back({level, std::string(message)});
    }

    size_t count(circuitguard::LogLevel level) const {
        std::lock_guard<std::mutex> lock(mtx_);
        size_t n = 0;
        for (const auto& e : entries_) {
            if (e.level == level) ++n;
        }
        return n;
    }

    bool contains(std::string_view fragment) const {
        std::lock_guard<std::mutex> lock(mtx_);
        for (const auto& e : entries_) {
            if (e.message.find(fragment) != std::string::npos) return true;
        }
        return false;
    }

private:
    mutable std::mutex mtx_;
    std::vector<Entry> entries_;
};

} // namespace test_support

#endif // CIRCUITGUARD_TESTS_SUPPORT_H
