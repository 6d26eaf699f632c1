#include "internal/indexing/retry_policy.hpp"

#include <thread>

#include "internal/observability/logging.hpp"

namespace tasktree::indexing {

using observability::IntField;
using observability::StringField;

RetryPolicy::RetryPolicy(RetryOptions options, SleepFn sleep) : options_(options), sleep_(std::move(sleep)) {
  if (!sleep_) {
    sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
}

std::chrono::milliseconds RetryPolicy::BackoffFor(std::size_t retry) const {
  if (retry == 0) return std::chrono::milliseconds(0);
  return options_.initial_backoff * (1LL << (retry - 1));
}

RetryOutcome RetryPolicy::Run(const AttemptFn& attempt, std::string_view label) const {
  RetryOutcome              out;
  RetryState                state = RetryState::kAttempting;
  std::chrono::milliseconds delay{0};

  for (;;) {
    switch (state) {
      case RetryState::kAttempting:
        ++out.attempts;
        out.result = attempt();

        if (out.result) {
          state = RetryState::kSucceeded;
        } else if (out.result.status == UpsertStatus::kClient) {
          TASKTREE_LOG_ERROR("Upsert rejected; not retrying", {StringField("batch", label), StringField("error", out.result.message)});
          state = RetryState::kFailed;
        } else if (out.attempts > options_.max_retries) {
          TASKTREE_LOG_ERROR("Upsert retries exhausted", {StringField("batch", label), IntField("attempts", static_cast<std::int64_t>(out.attempts)),
                                                          StringField("error", out.result.message)});
          state = RetryState::kFailed;
        } else {
          delay = BackoffFor(out.attempts);
          TASKTREE_LOG_WARN("Upsert failed; backing off", {StringField("batch", label), IntField("attempt", static_cast<std::int64_t>(out.attempts)),
                                                           IntField("backoff_ms", delay.count()), StringField("error", out.result.message)});
          state = RetryState::kBackingOff;
        }
        break;

      case RetryState::kBackingOff:
        sleep_(delay);
        state = RetryState::kAttempting;
        break;

      case RetryState::kSucceeded:
      case RetryState::kFailed:
        out.state = state;
        return out;
    }
  }
}

} // namespace tasktree::indexing
