#include "internal/skeleton/task_record.hpp"

namespace tasktree::skeleton {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

EntryKind KindOf(const OutlineContent& content) {
  return static_cast<EntryKind>(content.index());
}

std::string_view TextOf(const OutlineContent& content) {
  return std::visit([](const auto& entry) -> std::string_view { return entry.text; }, content);
}

std::string_view ToolNameOf(const OutlineContent& content) {
  return std::visit(Overloaded{
                        [](const UserText&) -> std::string_view { return {}; },
                        [](const AssistantText&) -> std::string_view { return {}; },
                        [](const ToolCall& call) -> std::string_view { return call.tool_name; },
                        [](const ToolResult& result) -> std::string_view { return result.tool_name; },
                    },
                    content);
}

std::string_view KindName(EntryKind kind) {
  switch (kind) {
    case EntryKind::kUserText:
      return "user";
    case EntryKind::kAssistantText:
      return "assistant";
    case EntryKind::kToolCall:
      return "tool_call";
    case EntryKind::kToolResult:
      return "tool_result";
  }
  return "unknown";
}

std::optional<EntryKind> ParseKind(std::string_view name) {
  if (name == "user") return EntryKind::kUserText;
  if (name == "assistant") return EntryKind::kAssistantText;
  if (name == "tool_call") return EntryKind::kToolCall;
  if (name == "tool_result") return EntryKind::kToolResult;
  return std::nullopt;
}

OutlineContent MakeContent(EntryKind kind, std::string text, std::string tool_name) {
  switch (kind) {
    case EntryKind::kUserText:
      return UserText{std::move(text)};
    case EntryKind::kAssistantText:
      return AssistantText{std::move(text)};
    case EntryKind::kToolCall:
      return ToolCall{std::move(tool_name), std::move(text)};
    case EntryKind::kToolResult:
      return ToolResult{std::move(tool_name), std::move(text)};
  }
  return UserText{std::move(text)};
}

} // namespace tasktree::skeleton
