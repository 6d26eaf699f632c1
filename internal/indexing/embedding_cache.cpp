#include "internal/indexing/embedding_cache.hpp"

#include <algorithm>

#include "internal/util/hash.hpp"

namespace tasktree::indexing {

EmbeddingCache::EmbeddingCache(EmbeddingCacheOptions options, util::ClockFn clock) : options_(options), clock_(std::move(clock)) {
}

std::optional<std::vector<float>> EmbeddingCache::Get(const std::string& text) {
  const auto key = util::ContentKey(text);

  std::lock_guard lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  if (clock_() - it->second.stored_at > options_.ttl) {
    entries_.erase(it);
    order_.erase(std::remove(order_.begin(), order_.end(), key), order_.end());
    return std::nullopt;
  }
  return it->second.vector;
}

void EmbeddingCache::Put(const std::string& text, std::vector<float> vector) {
  if (options_.max_entries == 0) {
    return;
  }
  const auto key = util::ContentKey(text);

  std::lock_guard lock(mutex_);
  auto it = entries_.find(key);
  if (it != entries_.end()) {
    it->second = Entry{std::move(vector), clock_()};
    order_.erase(std::remove(order_.begin(), order_.end(), key), order_.end());
    order_.push_back(key);
    return;
  }

  while (entries_.size() >= options_.max_entries && !order_.empty()) {
    entries_.erase(order_.front());
    order_.pop_front();
  }
  entries_.emplace(key, Entry{std::move(vector), clock_()});
  order_.push_back(key);
}

void EmbeddingCache::Clear() {
  std::lock_guard lock(mutex_);
  entries_.clear();
  order_.clear();
}

std::size_t EmbeddingCache::Size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

} // namespace tasktree::indexing
