#ifndef CIRCUITGUARD_EXCEPTIONS_H
#define CIRCUITGUARD_EXCEPTIONS_H

#include <chrono>
#include <stdexcept>
#include <string>

namespace circuitguard {

/**
 * @brief Base class for errors synthesized by a Guard itself.
 * Errors raised by the protected operation are never wrapped in this type.
 */
class GuardError : public std::runtime_error {
public:
    explicit GuardError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Raised when a call is rejected because the circuit is Open.
 * The protected operation was not invoked.
 */
class CircuitOpenError : public GuardError {
    std::chrono::milliseconds retry_after_;
public:
    explicit CircuitOpenError(std::chrono::milliseconds retry_after = std::chrono::milliseconds(0),
                              const std::string& msg = "Service is unavailable. Circuit breaker is in open state.")
        : GuardError(msg), retry_after_(retry_after) {}

    /** @brief Time left in the cooldown when the call was rejected. */
    std::chrono::milliseconds retry_after() const { return retry_after_; }
};

} // namespace circuitguard

#endif // CIRCUITGUARD_EXCEPTIONS_H
