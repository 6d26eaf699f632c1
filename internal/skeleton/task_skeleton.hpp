#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/skeleton/task_record.hpp"

namespace tasktree::skeleton {

inline constexpr std::size_t kDefaultMaxEntryChars = 8000;

struct OutlineEntry {
  OutlineContent content;
  // Length of the original text, before truncation.
  std::size_t size      = 0;
  bool        truncated = false;
};

/*
  TaskSkeleton

  In-memory summary of one task. Owned by the SkeletonCache; everything
  downstream (resolver, chunk extractor, tree views) reads it only.
*/
struct TaskSkeleton {
  std::string                task_id;
  std::optional<std::string> parent_task_id;
  std::string                workspace;
  std::string                title;
  std::optional<std::string> host_os;

  util::TimePoint created_at;
  util::TimePoint last_activity;

  std::string instruction;

  std::uint64_t message_count = 0;
  std::uint64_t action_count  = 0;
  std::uint64_t total_size    = 0;

  std::vector<OutlineEntry> outline;
};

TaskSkeleton BuildSkeleton(const TaskRecord& record, std::size_t max_entry_chars = kDefaultMaxEntryChars);

} // namespace tasktree::skeleton
