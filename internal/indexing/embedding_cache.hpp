#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/util/time.hpp"

namespace tasktree::indexing {

struct EmbeddingCacheOptions {
  std::chrono::milliseconds ttl{std::chrono::hours(24 * 7)};
  std::size_t               max_entries = 50000;
};

/*
  Content-hash keyed embedding cache. Entries expire after `ttl`; past
  `max_entries` the oldest insertion is evicted first. Thread-safe.
*/
class EmbeddingCache {
 public:
  explicit EmbeddingCache(EmbeddingCacheOptions options = {}, util::ClockFn clock = util::Now);

  std::optional<std::vector<float>> Get(const std::string& text);

  void Put(const std::string& text, std::vector<float> vector);

  void Clear();

  std::size_t Size() const;

 private:
  struct Entry {
    std::vector<float> vector;
    util::TimePoint    stored_at;
  };

  EmbeddingCacheOptions options_;
  util::ClockFn         clock_;

  mutable std::mutex                     mutex_;
  std::unordered_map<std::string, Entry> entries_;
  std::deque<std::string>                order_;
};

} // namespace tasktree::indexing
