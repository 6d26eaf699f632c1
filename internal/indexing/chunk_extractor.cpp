#include "internal/indexing/chunk_extractor.hpp"

#include <set>

#include "internal/observability/logging.hpp"
#include "internal/text/canonicalizer.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace tasktree::indexing {

using observability::IntField;
using observability::StringField;

namespace {

constexpr std::string_view kEntrySeparator = "\n\n";
constexpr std::string_view kMixedRole      = "mixed";

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool IsContinuationByte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

ChunkType TypeOf(skeleton::EntryKind kind) {
  switch (kind) {
    case skeleton::EntryKind::kUserText:
    case skeleton::EntryKind::kAssistantText:
      return ChunkType::kMessageExchange;
    case skeleton::EntryKind::kToolCall:
    case skeleton::EntryKind::kToolResult:
      return ChunkType::kToolInteraction;
  }
  return ChunkType::kToolInteraction;
}

struct PendingChunk {
  ChunkType             type;
  std::string           content;
  std::set<std::string> roles;
  std::size_t           chunk_index  = 0;
  std::size_t           total_chunks = 1;
};

google::protobuf::Value StringValue(std::string_view s) {
  google::protobuf::Value v;
  v.set_string_value(std::string(s));
  return v;
}

google::protobuf::Value NumberValue(double d) {
  google::protobuf::Value v;
  v.set_number_value(d);
  return v;
}

google::protobuf::Value NullableValue(const std::optional<std::string>& s) {
  google::protobuf::Value v;
  if (s) {
    v.set_string_value(*s);
  } else {
    v.set_null_value(google::protobuf::NULL_VALUE);
  }
  return v;
}

google::protobuf::Value OptionalValue(const std::optional<std::string>& s) {
  // Left unset ("undefined") when absent; the sanitizer drops it.
  google::protobuf::Value v;
  if (s) v.set_string_value(*s);
  return v;
}

} // namespace

std::string_view ChunkTypeName(ChunkType type) {
  switch (type) {
    case ChunkType::kMessageExchange:
      return "message_exchange";
    case ChunkType::kToolInteraction:
      return "tool_interaction";
  }
  return "unknown";
}

std::vector<std::string> SplitText(std::string_view text, std::size_t max_chars) {
  std::vector<std::string> pieces;
  if (max_chars == 0) {
    pieces.emplace_back(text);
    return pieces;
  }

  std::size_t pos = 0;
  while (pos < text.size()) {
    while (pos < text.size() && IsSpace(text[pos])) ++pos;
    if (pos >= text.size()) break;

    if (text.size() - pos <= max_chars) {
      pieces.emplace_back(text.substr(pos));
      break;
    }

    std::size_t cut = pos + max_chars;
    std::size_t ws  = cut;
    while (ws > pos && !IsSpace(text[ws])) --ws;

    if (ws > pos) {
      cut = ws;
    } else {
      while (cut > pos + 1 && IsContinuationByte(text[cut])) --cut;
    }

    auto piece = text.substr(pos, cut - pos);
    while (!piece.empty() && IsSpace(piece.back())) piece.remove_suffix(1);
    pieces.emplace_back(piece);
    pos = cut;
  }
  return pieces;
}

ChunkExtractor::ChunkExtractor(std::shared_ptr<skeleton::SkeletonCache> cache, ChunkExtractorOptions options)
    : cache_(std::move(cache)), options_(options) {
  if (options_.max_chunk_chars == 0) options_.max_chunk_chars = kDefaultMaxChunkChars;
}

std::vector<Chunk> ChunkExtractor::Extract(const std::string& task_id) const {
  const auto snapshot = cache_->All();
  auto it = snapshot->find(task_id);
  if (it == snapshot->end()) {
    TASKTREE_LOG_WARN("Chunk extraction skipped: task not in skeleton cache", {StringField("task_id", task_id)});
    return {};
  }

  // Root: topmost explicit ancestor.
  const auto& s = it->second;
  std::optional<std::string> root;
  std::set<std::string>      seen{task_id};
  for (auto parent = s.parent_task_id; parent && seen.insert(*parent).second;) {
    root      = parent;
    auto next = snapshot->find(*parent);
    if (next == snapshot->end()) break;
    parent = next->second.parent_task_id;
  }

  return Extract(s, s.parent_task_id, root);
}

std::vector<Chunk> ChunkExtractor::Extract(const skeleton::TaskSkeleton& s, const std::optional<std::string>& parent_task_id,
                                           const std::optional<std::string>& root_task_id) const {
  const auto max_chars = options_.max_chunk_chars;

  std::vector<PendingChunk>   pending;
  std::optional<PendingChunk> current;

  auto flush = [&]() {
    if (current && !current->content.empty()) pending.push_back(std::move(*current));
    current.reset();
  };

  for (const auto& entry : s.outline) {
    const auto text = skeleton::TextOf(entry.content);
    if (text.find_first_not_of(" \t\r\n") == std::string_view::npos) continue;

    const auto kind = skeleton::KindOf(entry.content);
    const auto type = TypeOf(kind);
    const auto role = std::string(skeleton::KindName(kind));

    if (text.size() > max_chars) {
      flush();
      const auto pieces = SplitText(text, max_chars);
      for (std::size_t i = 0; i < pieces.size(); ++i) {
        pending.push_back(PendingChunk{type, pieces[i], {role}, i, pieces.size()});
      }
      continue;
    }

    if (current && current->type == type && current->content.size() + kEntrySeparator.size() + text.size() <= max_chars) {
      current->content += kEntrySeparator;
      current->content += text;
      current->roles.insert(role);
      continue;
    }

    flush();
    current = PendingChunk{type, std::string(text), {role}, 0, 1};
  }
  flush();

  // Pieces of one split entry share a sequence order.
  std::vector<Chunk> chunks;
  chunks.reserve(pending.size());
  std::size_t sequence = 0;
  for (std::size_t i = 0; i < pending.size(); ++i) {
    auto& p = pending[i];
    if (i > 0 && p.chunk_index == 0) ++sequence;

    Chunk c;
    c.task_id        = s.task_id;
    c.type           = p.type;
    c.sequence_order = sequence;
    c.chunk_index    = p.chunk_index;
    c.total_chunks   = p.total_chunks;
    c.role           = p.roles.size() == 1 ? *p.roles.begin() : std::string(kMixedRole);
    c.content        = std::move(p.content);
    c.indexed        = p.type == ChunkType::kMessageExchange;
    c.chunk_id = util::ToString(util::NameBasedUUID(s.task_id + ":" + std::to_string(c.sequence_order) + ":" + std::to_string(c.chunk_index)));

    auto& f = *c.payload.mutable_fields();
    f["task_id"]         = StringValue(c.task_id);
    f["parent_task_id"]  = NullableValue(parent_task_id);
    f["root_task_id"]    = NullableValue(root_task_id);
    f["chunk_id"]        = StringValue(c.chunk_id);
    f["chunk_type"]      = StringValue(ChunkTypeName(c.type));
    f["sequence_order"]  = NumberValue(static_cast<double>(c.sequence_order));
    f["chunk_index"]     = NumberValue(static_cast<double>(c.chunk_index));
    f["total_chunks"]    = NumberValue(static_cast<double>(c.total_chunks));
    f["timestamp"]       = StringValue(util::ToRfc3339(s.last_activity));
    f["content"]         = StringValue(c.content);
    f["content_summary"] = StringValue(std::string(tasktree::text::Utf8Prefix(c.content, kContentSummaryChars)));
    f["workspace"]       = StringValue(s.workspace);
    f["task_title"]      = StringValue(s.title);
    f["role"]            = StringValue(c.role);
    f["host_os"]         = OptionalValue(s.host_os);
    f["indexed"].set_bool_value(c.indexed);

    chunks.push_back(std::move(c));
  }

  TASKTREE_LOG_DEBUG("Chunks extracted", {StringField("task_id", s.task_id), IntField("entries", static_cast<std::int64_t>(s.outline.size())),
                                          IntField("chunks", static_cast<std::int64_t>(chunks.size()))});
  return chunks;
}

} // namespace tasktree::indexing
