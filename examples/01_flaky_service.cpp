#include <circuitguard/guard.h>
#include <circuitguard/environment.h>
#include <circuitguard/exceptions.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <iostream>
#include <stdexcept>

using namespace circuitguard;
using namespace std::chrono_literals;

// Pretend remote service: down for the first few calls, then recovers.
class InventoryClient {
    int calls_ = 0;
public:
    Async<int> stock_level(const std::string& sku) {
        ++calls_;
        co_await delay(20ms);
        if (calls_ <= 3) {
            throw std::runtime_error("inventory service timed out for " + sku);
        }
        co_return 12;
    }

    int calls() const { return calls_; }
};

int main() {
    load_env();

    auto& logger = Logger::instance();
    logger.configure(env<std::string>("INVENTORY_LOG", "stdout"));

    GuardConfig config{
        .threshold = env<int>("INVENTORY_THRESHOLD", 2),
        .timeout = env<std::chrono::milliseconds>("INVENTORY_TIMEOUT_MS", 300ms),
        .name = "inventory"
    };

    Guard guard(config, &logger);
    guard.on_state_change([&] {
        std::cout << "state -> " << to_string(guard.state()) << "\n";
    });

    InventoryClient client;
    boost::asio::io_context ioc;

    boost::asio::co_spawn(ioc, [&]() -> Async<void> {
        for (int i = 0; i < 8; ++i) {
            try {
                auto level = co_await guard.execute([&]() -> Async<int> {
                    co_return co_await client.stock_level("SKU-1042");
                });
                std::cout << "attempt " << i << ": stock " << level.value_or(-1) << "\n";
            } catch (const CircuitOpenError& e) {
                std::cout << "attempt " << i << ": unavailable, retry in "
                          << e.retry_after().count() << "ms\n";
            } catch (const std::exception& e) {
                std::cout << "attempt " << i << ": " << e.what() << "\n";
            }
            co_await delay(120ms);
        }
    }, boost::asio::detached);

    ioc.run();

    std::cout << "dependency was called " << client.calls() << " times\n";
    return 0;
}
