#ifndef SCRIPTOR_EXCEPTIONS_H
#define SCRIPTOR_EXCEPTIONS_H

#include <stdexcept>
#include <string>
#include <optional>

namespace scriptor {

/**
 * @brief Base class for all client-layer exceptions in Scriptor.
 */
class ClientError : public std::runtime_error {
public:
    explicit ClientError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Fatal setup problem (missing credentials, no usable backend).
 * Never retried.
 */
class ConfigurationError : public ClientError {
public:
    explicit ConfigurationError(const std::string& msg) : ClientError("Configuration error: " + msg) {}
};

/** @brief The session's circuit breaker rejected the call before any network attempt. */
class CircuitOpenError : public ClientError {
    std::string state_;
public:
    explicit CircuitOpenError(std::string state)
        : ClientError("Circuit open (state: " + state + "), backend call rejected"),
          state_(std::move(state)) {}

    const std::string& state() const { return state_; }
};

/**
 * @brief Timeout, network failure, error status or empty body.
 * Retried with backoff by the session.
 */
class TransientBackendError : public ClientError {
    std::optional<int> status_;
public:
    explicit TransientBackendError(const std::string& msg, std::optional<int> status = std::nullopt)
        : ClientError(msg), status_(status) {}

    std::optional<int> status() const { return status_; }
};

/** @brief Raised once every attempt of a session call has failed. */
class ExhaustedRetriesError : public ClientError {
    int attempts_;
    std::string last_error_;
public:
    ExhaustedRetriesError(int attempts, std::string last_error)
        : ClientError("Backend call failed after " + std::to_string(attempts) + " attempts: " + last_error),
          attempts_(attempts), last_error_(std::move(last_error)) {}

    int attempts() const { return attempts_; }
    const std::string& last_error() const { return last_error_; }
};

/** @brief The bounded worker pool refused a task. */
class QueueFullError : public ClientError {
public:
    QueueFullError() : ClientError("Worker queue is full") {}
};

} // namespace scriptor

#endif
