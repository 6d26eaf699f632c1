#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <type_traits>

namespace tasktree::indexing {

/*
  RateLimiter

  FIFO queue drained by a single worker thread. Consecutive jobs start at
  least `min_interval` apart, whatever the number of callers.

  Shutdown() runs the jobs already queued, then stops the worker; later
  Schedule() calls throw util::ResourceExhausted.
*/
class RateLimiter {
 public:
  explicit RateLimiter(std::chrono::milliseconds min_interval);
  ~RateLimiter();

  RateLimiter(const RateLimiter&)            = delete;
  RateLimiter& operator=(const RateLimiter&) = delete;

  template <typename Fn>
  auto Schedule(Fn fn) -> std::future<std::invoke_result_t<Fn>> {
    using R   = std::invoke_result_t<Fn>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
    auto fut  = task->get_future();
    Enqueue([task]() { (*task)(); });
    return fut;
  }

  void Shutdown();

  std::chrono::milliseconds Interval() const {
    return min_interval_;
  }

 private:
  void Enqueue(std::function<void()> job);
  void Run();

  std::chrono::milliseconds min_interval_;

  std::mutex                        mutex_;
  std::condition_variable           cv_;
  std::queue<std::function<void()>> queue_;
  bool                              shutdown_ = false;

  std::thread worker_;
};

} // namespace tasktree::indexing
