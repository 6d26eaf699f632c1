#include "internal/indexing/circuit_breaker.hpp"

#include "internal/observability/logging.hpp"

namespace tasktree::indexing {

using observability::IntField;
using observability::StringField;

std::string_view CircuitStateName(CircuitState state) {
  switch (state) {
    case CircuitState::kClosed:
      return "closed";
    case CircuitState::kOpen:
      return "open";
    case CircuitState::kHalfOpen:
      return "half_open";
  }
  return "unknown";
}

CircuitBreaker::CircuitBreaker(std::string name, CircuitBreakerOptions options, util::ClockFn clock)
    : name_(std::move(name)), options_(options), clock_(std::move(clock)) {
  if (options_.failure_threshold == 0) options_.failure_threshold = 1;
}

bool CircuitBreaker::AllowRequest() {
  std::lock_guard lock(mutex_);
  if (state_ == CircuitState::kOpen) {
    if (clock_() - opened_at_ < options_.open_timeout) {
      return false;
    }
    TransitionLocked(CircuitState::kHalfOpen);
  }
  return true;
}

void CircuitBreaker::RecordSuccess() {
  std::lock_guard lock(mutex_);
  failures_ = 0;
  if (state_ != CircuitState::kClosed) {
    TransitionLocked(CircuitState::kClosed);
  }
}

void CircuitBreaker::RecordFailure() {
  std::lock_guard lock(mutex_);
  ++failures_;
  if (state_ == CircuitState::kHalfOpen || (state_ == CircuitState::kClosed && failures_ >= options_.failure_threshold)) {
    opened_at_ = clock_();
    TransitionLocked(CircuitState::kOpen);
  }
}

void CircuitBreaker::Reset() {
  std::lock_guard lock(mutex_);
  failures_ = 0;
  if (state_ != CircuitState::kClosed) {
    TransitionLocked(CircuitState::kClosed);
  }
}

CircuitState CircuitBreaker::State() const {
  std::lock_guard lock(mutex_);
  return state_;
}

void CircuitBreaker::TransitionLocked(CircuitState next) {
  const auto previous = state_;
  state_              = next;

  if (next == CircuitState::kOpen) {
    TASKTREE_LOG_WARN("Circuit breaker opened", {StringField("breaker", name_), StringField("from", CircuitStateName(previous)),
                                                 IntField("consecutive_failures", static_cast<std::int64_t>(failures_)),
                                                 IntField("open_timeout_ms", options_.open_timeout.count())});
  } else {
    TASKTREE_LOG_INFO("Circuit breaker state change",
                      {StringField("breaker", name_), StringField("from", CircuitStateName(previous)), StringField("to", CircuitStateName(next))});
  }
}

} // namespace tasktree::indexing
