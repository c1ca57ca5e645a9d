#ifndef SCRIPTOR_UTIL_CIRCUIT_BREAKER_H
#define SCRIPTOR_UTIL_CIRCUIT_BREAKER_H

#include <chrono>
#include <mutex>
#include <optional>
#include <string_view>

namespace scriptor {

struct CircuitBreakerConfig {
    int failure_threshold = 5;
    std::chrono::milliseconds reset_timeout{std::chrono::seconds(300)};
    int half_open_max_calls = 3;
};

/**
 * @brief Circuit Breaker to stop hammering a failing backend.
 *
 * Closed -> Open once failure_threshold failures accumulate without an
 * intervening success. Open -> HalfOpen on the first can_execute() after
 * reset_timeout. HalfOpen -> Closed after half_open_max_calls successes,
 * HalfOpen -> Open on any failure.
 *
 * All state lives behind one mutex; no method blocks beyond that section.
 */
class CircuitBreaker {
public:
    enum class State {
        Closed,
        Open,
        HalfOpen
    };

    using Clock = std::chrono::steady_clock;

    explicit CircuitBreaker(CircuitBreakerConfig config = {});

    /**
     * @brief Checks if a call should be attempted.
     * @return false while Open and the reset timeout has not elapsed.
     */
    bool can_execute();

    void record_success();
    void record_failure();

    /**
     * @brief Back to Closed with all counters cleared.
     */
    void reset();

    State state() const;
    int failure_count() const;
    int half_open_calls() const;
    std::optional<Clock::time_point> last_failure_time() const;
    const CircuitBreakerConfig& config() const { return config_; }

private:
    CircuitBreakerConfig config_;
    mutable std::mutex mutex_;
    State state_{State::Closed};
    int failure_count_{0};
    int half_open_calls_{0};
    std::optional<Clock::time_point> last_failure_time_;
};

std::string_view to_string(CircuitBreaker::State state);

} // namespace scriptor

#endif // SCRIPTOR_UTIL_CIRCUIT_BREAKER_H
