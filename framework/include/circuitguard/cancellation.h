#ifndef CIRCUITGUARD_CANCELLATION_H
#define CIRCUITGUARD_CANCELLATION_H

#include <stdexcept>
#include <stop_token>
#include <string>

namespace circuitguard {

/**
 * @brief Cancellation outcome tagged with the token it was raised for.
 *
 * A Guard compares token() against the caller's own token to tell a
 * cancellation it must absorb from one that belongs to someone else.
 */
class OperationCancelled : public std::runtime_error {
    std::stop_token token_;
public:
    explicit OperationCancelled(std::stop_token token, const std::string& msg = "Operation was cancelled.")
        : std::runtime_error(msg), token_(std::move(token)) {}

    const std::stop_token& token() const { return token_; }
};

inline void throw_if_cancelled(const std::stop_token& token) {
    if (token.stop_requested()) {
        throw OperationCancelled(token);
    }
}

// Same stop state, not merely "also stopped".
inline bool is_cancelled_by(const OperationCancelled& e, const std::stop_token& token) {
    return e.token() == token;
}

} // namespace circuitguard

#endif // CIRCUITGUARD_CANCELLATION_H
