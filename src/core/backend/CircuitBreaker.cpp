#include "CircuitBreaker.hpp"

#include <spdlog/spdlog.h>

namespace switchboard::core {

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig cfg) : cfg_(cfg) {
    if (cfg_.failure_threshold == 0) {
        cfg_.failure_threshold = 1;
    }
}

bool CircuitBreaker::AllowRequest() {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
        case State::Closed:
            return true;
        case State::Open:
            if (clock::now() - opened_at_ < cfg_.open_duration) {
                return false;
            }
            state_ = State::HalfOpen;
            trial_in_flight_ = true;
            return true;
        case State::HalfOpen:
            if (trial_in_flight_) {
                return false;
            }
            trial_in_flight_ = true;
            return true;
    }
    return false;
}

void CircuitBreaker::RecordSuccess() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = State::Closed;
    failures_ = 0;
    trial_in_flight_ = false;
}

void CircuitBreaker::RecordFailure() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++failures_;
    trial_in_flight_ = false;
    if (state_ == State::HalfOpen || failures_ >= cfg_.failure_threshold) {
        if (state_ != State::Open) {
            spdlog::warn("Circuit opened after {} consecutive failure(s)", failures_);
        }
        state_ = State::Open;
        opened_at_ = clock::now();
    }
}

void CircuitBreaker::ReleaseTrial() {
    std::lock_guard<std::mutex> lock(mutex_);
    trial_in_flight_ = false;
}

bool CircuitBreaker::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == State::Open && clock::now() - opened_at_ < cfg_.open_duration;
}

CircuitBreaker::State CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::size_t CircuitBreaker::consecutive_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

std::string_view to_string(CircuitBreaker::State state) noexcept {
    switch (state) {
        case CircuitBreaker::State::Closed:
            return "closed";
        case CircuitBreaker::State::Open:
            return "open";
        case CircuitBreaker::State::HalfOpen:
            return "half-open";
    }
    return "unknown";
}

}  // namespace switchboard::core
