#include "internal/indexing/rate_limiter.hpp"

#include "internal/util/errors.hpp"

namespace tasktree::indexing {

RateLimiter::RateLimiter(std::chrono::milliseconds min_interval) : min_interval_(min_interval) {
  worker_ = std::thread(&RateLimiter::Run, this);
}

RateLimiter::~RateLimiter() {
  Shutdown();
}

void RateLimiter::Enqueue(std::function<void()> job) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      throw util::ResourceExhausted("rate limiter is shut down");
    }
    queue_.push(std::move(job));
  }
  cv_.notify_one();
}

void RateLimiter::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

void RateLimiter::Run() {
  std::optional<std::chrono::steady_clock::time_point> last_start;

  for (;;) {
    std::function<void()> job;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });
      if (queue_.empty()) return;

      job = std::move(queue_.front());
      queue_.pop();
    }

    if (last_start) {
      std::this_thread::sleep_until(*last_start + min_interval_);
    }
    last_start = std::chrono::steady_clock::now();

    // packaged_task stores any exception in the caller's future
    job();
  }
}

} // namespace tasktree::indexing
