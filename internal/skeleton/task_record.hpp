#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "internal/util/time.hpp"

namespace tasktree::skeleton {

// ---------------------------------------------------------------------------
// Content outline entries
// ---------------------------------------------------------------------------

struct UserText {
  std::string text;
};

struct AssistantText {
  std::string text;
};

struct ToolCall {
  std::string tool_name;
  std::string text;
};

struct ToolResult {
  std::string tool_name;
  std::string text;
};

using OutlineContent = std::variant<UserText, AssistantText, ToolCall, ToolResult>;

enum class EntryKind { kUserText = 0, kAssistantText = 1, kToolCall = 2, kToolResult = 3 };

EntryKind        KindOf(const OutlineContent& content);
std::string_view TextOf(const OutlineContent& content);
std::string_view ToolNameOf(const OutlineContent& content);

// "user" / "assistant" / "tool_call" / "tool_result"
std::string_view KindName(EntryKind kind);
std::optional<EntryKind> ParseKind(std::string_view name);

OutlineContent MakeContent(EntryKind kind, std::string text, std::string tool_name = {});

/*
  TaskRecord

  One task as reported by a RecordScanner: metadata plus the full,
  untruncated content outline.
*/
struct TaskRecord {
  std::string                task_id;
  std::optional<std::string> parent_task_id;
  std::string                workspace;
  std::string                title;
  std::optional<std::string> host_os;

  util::TimePoint created_at;
  util::TimePoint last_activity;

  // Leading instruction the task was started with.
  std::string instruction;

  std::vector<OutlineContent> outline;
};

} // namespace tasktree::skeleton
