#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string_view>

#include "internal/indexing/vector_store.hpp"

namespace tasktree::indexing {

struct RetryOptions {
  // Retries after the initial attempt.
  std::size_t               max_retries = 3;
  std::chrono::milliseconds initial_backoff{2000};
};

enum class RetryState { kAttempting, kBackingOff, kSucceeded, kFailed };

struct RetryOutcome {
  RetryState   state    = RetryState::kFailed;
  UpsertResult result;
  std::size_t  attempts = 0;
};

/*
  RetryPolicy

    Attempting(n) -> Succeeded
                  -> Failed                      (client error, or retries used up)
                  -> BackingOff(initial * 2^(n-1)) -> Attempting(n+1)

  With the defaults: 2s, 4s, 8s between the four attempts.
*/
class RetryPolicy {
 public:
  using SleepFn   = std::function<void(std::chrono::milliseconds)>;
  using AttemptFn = std::function<UpsertResult()>;

  explicit RetryPolicy(RetryOptions options = {}, SleepFn sleep = {});

  RetryOutcome Run(const AttemptFn& attempt, std::string_view label = {}) const;

  // Delay before retry number `retry` (1-based).
  std::chrono::milliseconds BackoffFor(std::size_t retry) const;

  const RetryOptions& Options() const {
    return options_;
  }

 private:
  RetryOptions options_;
  SleepFn      sleep_;
};

} // namespace tasktree::indexing
