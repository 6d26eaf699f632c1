#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace tasktree::indexing {

struct CircuitBreakerOptions {
  std::size_t               failure_threshold = 3;
  std::chrono::milliseconds open_timeout{30000};
};

enum class CircuitState { kClosed, kOpen, kHalfOpen };

std::string_view CircuitStateName(CircuitState state);

/*
  CircuitBreaker

  CLOSED -> OPEN after `failure_threshold` consecutive failures.
  OPEN -> HALF_OPEN once `open_timeout` has passed (checked on the next
  AllowRequest). HALF_OPEN -> CLOSED on success, back to OPEN on failure.
*/
class CircuitBreaker {
 public:
  explicit CircuitBreaker(std::string name, CircuitBreakerOptions options = {}, util::ClockFn clock = util::Now);

  bool AllowRequest();
  void RecordSuccess();
  void RecordFailure();
  void Reset();

  CircuitState State() const;

 private:
  void TransitionLocked(CircuitState next);

  std::string           name_;
  CircuitBreakerOptions options_;
  util::ClockFn         clock_;

  mutable std::mutex mutex_;
  CircuitState       state_    = CircuitState::kClosed;
  std::size_t        failures_ = 0;
  util::TimePoint    opened_at_{};
};

} // namespace tasktree::indexing
