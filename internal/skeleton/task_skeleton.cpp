#include "internal/skeleton/task_skeleton.hpp"

#include "internal/text/canonicalizer.hpp"

namespace tasktree::skeleton {

namespace {

OutlineContent Truncated(const OutlineContent& content, std::size_t max_chars) {
  const auto text = TextOf(content);
  return MakeContent(KindOf(content), std::string(tasktree::text::Utf8Prefix(text, max_chars)), std::string(ToolNameOf(content)));
}

} // namespace

TaskSkeleton BuildSkeleton(const TaskRecord& record, std::size_t max_entry_chars) {
  TaskSkeleton s;
  s.task_id        = record.task_id;
  s.workspace      = record.workspace;
  s.title          = record.title;
  s.host_os        = record.host_os;
  s.created_at     = record.created_at;
  s.last_activity  = record.last_activity;
  s.instruction    = record.instruction;

  // A record never parents itself.
  if (record.parent_task_id && !record.parent_task_id->empty() && *record.parent_task_id != record.task_id) {
    s.parent_task_id = record.parent_task_id;
  }

  s.outline.reserve(record.outline.size());
  for (const auto& content : record.outline) {
    const auto size = TextOf(content).size();

    switch (KindOf(content)) {
      case EntryKind::kUserText:
      case EntryKind::kAssistantText:
        ++s.message_count;
        break;
      case EntryKind::kToolCall:
        ++s.action_count;
        break;
      case EntryKind::kToolResult:
        break;
    }
    s.total_size += size;

    OutlineEntry entry;
    entry.size = size;
    if (max_entry_chars > 0 && size > max_entry_chars) {
      entry.content   = Truncated(content, max_entry_chars);
      entry.truncated = true;
    } else {
      entry.content = content;
    }
    s.outline.push_back(std::move(entry));
  }

  return s;
}

} // namespace tasktree::skeleton
