#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string_view>

namespace switchboard::core {

struct CircuitBreakerConfig {
    std::size_t failure_threshold = 5;
    std::chrono::milliseconds open_duration{30000};
};

/**
 * @brief Stops recovery attempts against a persistently failing backend.
 *
 *   Closed --(failure_threshold consecutive failures)--> Open
 *   Open   --(open_duration elapsed)-------------------> HalfOpen
 *   HalfOpen --(success)--> Closed, --(failure)--> Open
 *
 * HalfOpen admits a single trial request at a time. Thread-safe.
 */
class CircuitBreaker {
   public:
    enum class State { Closed, Open, HalfOpen };

    explicit CircuitBreaker(CircuitBreakerConfig cfg = {});

    bool AllowRequest();
    void RecordSuccess();
    void RecordFailure();
    // Gives back a trial admitted by AllowRequest() without an outcome, for
    // example when the caller was cancelled before reaching the backend.
    void ReleaseTrial();

    // Open and still inside open_duration: calls are rejected outright.
    bool IsOpen() const;

    State state() const;
    std::size_t consecutive_failures() const;

   private:
    using clock = std::chrono::steady_clock;

    CircuitBreakerConfig cfg_;
    mutable std::mutex mutex_;
    State state_ = State::Closed;
    std::size_t failures_ = 0;
    clock::time_point opened_at_{};
    bool trial_in_flight_ = false;
};

std::string_view to_string(CircuitBreaker::State state) noexcept;

}  // namespace switchboard::core
