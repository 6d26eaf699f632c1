#include "internal/skeleton/delegation.hpp"

#include "internal/text/canonicalizer.hpp"

namespace tasktree::skeleton {

namespace {

constexpr std::string_view kNewTaskTool  = "new_task";
constexpr std::string_view kNewTaskOpen  = "<new_task";
constexpr std::string_view kNewTaskClose = "</new_task>";

std::string LowerAscii(std::string_view text) {
  std::string out(text);
  for (auto& c : out) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return out;
}

// Every <new_task>...</new_task> block of `text`, tags included.
std::vector<std::string> NewTaskBlocks(const std::string& text) {
  std::vector<std::string> blocks;

  const auto lowered = LowerAscii(text);
  std::size_t from   = 0;
  for (;;) {
    const auto open = lowered.find(kNewTaskOpen, from);
    if (open == std::string::npos) break;
    const auto close = lowered.find(kNewTaskClose, open);
    if (close == std::string::npos) break;

    const auto end = close + kNewTaskClose.size();
    blocks.push_back(text.substr(open, end - open));
    from = end;
  }
  return blocks;
}

void AppendBlockFragments(const std::string& decoded, std::vector<std::string>& out) {
  for (auto block : NewTaskBlocks(decoded)) {
    for (auto& fragment : text::ExtractDelegationBlocks(block)) {
      out.push_back(std::move(fragment));
    }
  }
}

} // namespace

std::vector<std::string> ExtractDelegationFragments(const TaskSkeleton& skeleton) {
  std::vector<std::string> fragments;

  for (const auto& entry : skeleton.outline) {
    const auto kind = KindOf(entry.content);
    if (kind != EntryKind::kAssistantText && kind != EntryKind::kToolCall) {
      continue;
    }

    const auto decoded = text::DecodeEntities(text::Unescape(text::StripByteOrderMark(TextOf(entry.content))));
    const auto before  = fragments.size();
    AppendBlockFragments(decoded, fragments);

    if (fragments.size() == before && kind == EntryKind::kToolCall && ToolNameOf(entry.content) == kNewTaskTool) {
      // Structured tool call: a <message> wrapper may still be present.
      auto working = decoded;
      auto inner   = text::ExtractDelegationBlocks(working);
      if (!inner.empty()) {
        fragments.push_back(std::move(inner.front()));
        continue;
      }
      auto whole = text::CollapseWhitespace(text::StripTags(decoded));
      if (!text::Canonicalize(whole).empty()) {
        fragments.push_back(std::move(whole));
      }
    }
  }

  return fragments;
}

} // namespace tasktree::skeleton
