#include <scriptor/util/circuit_breaker.h>
#include <scriptor/logger.h>
#include <string>

namespace scriptor {

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config)
    : config_(config) {}

bool CircuitBreaker::can_execute() {
    std::lock_guard<std::mutex> lock(mutex_);

    switch (state_) {
        case State::Closed:
            return true;

        case State::Open:
            if (last_failure_time_ &&
                Clock::now() - *last_failure_time_ >= config_.reset_timeout) {
                state_ = State::HalfOpen;
                half_open_calls_ = 0;
                Logger::instance().info("Circuit breaker half-open, probing backend");
                return true;
            }
            return false;

        case State::HalfOpen:
            return half_open_calls_ < config_.half_open_max_calls;
    }
    return false;
}

void CircuitBreaker::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ == State::HalfOpen) {
        ++half_open_calls_;
        if (half_open_calls_ >= config_.half_open_max_calls) {
            state_ = State::Closed;
            failure_count_ = 0;
            Logger::instance().info("Circuit breaker closed");
        }
    } else {
        failure_count_ = 0;
    }
}

void CircuitBreaker::record_failure() {
    std::lock_guard<std::mutex> lock(mutex_);

    ++failure_count_;
    last_failure_time_ = Clock::now();

    if (failure_count_ >= config_.failure_threshold) {
        if (state_ != State::Open) {
            state_ = State::Open;
            Logger::instance().warn("Circuit breaker opened after " +
                                    std::to_string(failure_count_) + " failures");
        }
    } else if (state_ == State::HalfOpen) {
        state_ = State::Open;
        Logger::instance().warn("Circuit breaker failed while half-open, reopening");
    }
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = State::Closed;
    failure_count_ = 0;
    half_open_calls_ = 0;
    last_failure_time_.reset();
}

CircuitBreaker::State CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

int CircuitBreaker::failure_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_count_;
}

int CircuitBreaker::half_open_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return half_open_calls_;
}

std::optional<CircuitBreaker::Clock::time_point> CircuitBreaker::last_failure_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_failure_time_;
}

std::string_view to_string(CircuitBreaker::State state) {
    switch (state) {
        case CircuitBreaker::State::Closed:   return "closed";
        case CircuitBreaker::State::Open:     return "open";
        case CircuitBreaker::State::HalfOpen: return "half_open";
    }
    return "unknown";
}

} // namespace scriptor
