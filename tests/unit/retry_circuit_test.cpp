#include <cassert>
#include <chrono>
#include <iostream>
#include <vector>

#include "internal/indexing/circuit_breaker.hpp"
#include "internal/indexing/retry_policy.hpp"

namespace {

using namespace std::chrono_literals;
using tasktree::indexing::CircuitBreaker;
using tasktree::indexing::CircuitBreakerOptions;
using tasktree::indexing::CircuitState;
using tasktree::indexing::RetryPolicy;
using tasktree::indexing::RetryState;
using tasktree::indexing::UpsertResult;
using tasktree::indexing::UpsertStatus;

struct RecordedSleeps {
  std::vector<std::chrono::milliseconds> delays;

  RetryPolicy::SleepFn Fn() {
    return [this](std::chrono::milliseconds d) { delays.push_back(d); };
  }
};

void TestBackoffDoublesFromInitial() {
  RetryPolicy policy;
  assert(policy.BackoffFor(1) == 2000ms);
  assert(policy.BackoffFor(2) == 4000ms);
  assert(policy.BackoffFor(3) == 8000ms);
}

void TestTransientFailuresAreRetriedUntilSuccess() {
  RecordedSleeps sleeps;
  RetryPolicy    policy({}, sleeps.Fn());

  int  calls   = 0;
  auto outcome = policy.Run([&] {
    ++calls;
    return calls < 3 ? UpsertResult::Transient("503") : UpsertResult::Ok();
  });

  assert(outcome.state == RetryState::kSucceeded);
  assert(outcome.attempts == 3);
  assert(static_cast<bool>(outcome.result));
  assert((sleeps.delays == std::vector<std::chrono::milliseconds>{2000ms, 4000ms}));
}

void TestRetriesAreBounded() {
  RecordedSleeps sleeps;
  RetryPolicy    policy({}, sleeps.Fn());

  int  calls   = 0;
  auto outcome = policy.Run([&] {
    ++calls;
    return UpsertResult::Transient("connection reset");
  });

  assert(outcome.state == RetryState::kFailed);
  assert(calls == 4);
  assert(outcome.attempts == 4);
  assert(outcome.result.status == UpsertStatus::kTransient);
  assert((sleeps.delays == std::vector<std::chrono::milliseconds>{2000ms, 4000ms, 8000ms}));
}

void TestClientErrorsAreNotRetried() {
  RecordedSleeps sleeps;
  RetryPolicy    policy({}, sleeps.Fn());

  int  calls   = 0;
  auto outcome = policy.Run([&] {
    ++calls;
    return UpsertResult::Client("400 bad payload");
  });

  assert(outcome.state == RetryState::kFailed);
  assert(calls == 1);
  assert(sleeps.delays.empty());
  assert(outcome.result.message == "400 bad payload");
}

void TestBreakerOpensAndRecovers() {
  auto now   = tasktree::util::FromUnixMillis(1'700'000'000'000ULL);
  auto clock = [&now] { return now; };

  CircuitBreakerOptions options;
  options.failure_threshold = 3;
  options.open_timeout      = 30s;
  CircuitBreaker breaker("vector_store", options, clock);

  assert(breaker.State() == CircuitState::kClosed);
  breaker.RecordFailure();
  breaker.RecordFailure();
  assert(breaker.AllowRequest());
  breaker.RecordFailure();
  assert(breaker.State() == CircuitState::kOpen);
  assert(!breaker.AllowRequest());

  now += 29s;
  assert(!breaker.AllowRequest());

  now += 2s;
  assert(breaker.AllowRequest());
  assert(breaker.State() == CircuitState::kHalfOpen);

  // A failed probe reopens immediately.
  breaker.RecordFailure();
  assert(breaker.State() == CircuitState::kOpen);

  now += 31s;
  assert(breaker.AllowRequest());
  breaker.RecordSuccess();
  assert(breaker.State() == CircuitState::kClosed);
}

void TestSuccessResetsFailureCount() {
  CircuitBreaker breaker("vector_store");
  breaker.RecordFailure();
  breaker.RecordFailure();
  breaker.RecordSuccess();
  breaker.RecordFailure();
  breaker.RecordFailure();
  assert(breaker.State() == CircuitState::kClosed);

  breaker.RecordFailure();
  assert(breaker.State() == CircuitState::kOpen);
  breaker.Reset();
  assert(breaker.State() == CircuitState::kClosed);
  assert(breaker.AllowRequest());
}

} // namespace

int main() {
  TestBackoffDoublesFromInitial();
  TestTransientFailuresAreRetriedUntilSuccess();
  TestRetriesAreBounded();
  TestClientErrorsAreNotRetried();
  TestBreakerOpensAndRecovers();
  TestSuccessResetsFailureCount();

  std::cout << "tasktree_unit_retry_circuit: pass\n";
  return 0;
}
