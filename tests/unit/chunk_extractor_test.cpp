#include "internal/indexing/chunk_extractor.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <string>

#include "internal/skeleton/memory_record_scanner.hpp"
#include "internal/skeleton/skeleton_cache.hpp"

namespace {

using tasktree::indexing::ChunkExtractor;
using tasktree::indexing::ChunkType;
using tasktree::indexing::SplitText;
using tasktree::skeleton::EntryKind;
using tasktree::skeleton::MakeContent;
using tasktree::skeleton::MemoryRecordScanner;
using tasktree::skeleton::SkeletonCache;
using tasktree::skeleton::TaskRecord;

TaskRecord MakeRecord(const std::string& id, std::optional<std::string> parent) {
  TaskRecord r;
  r.task_id        = id;
  r.parent_task_id = std::move(parent);
  r.workspace      = "ws";
  r.title          = "Title " + id;
  r.created_at     = tasktree::util::FromUnixMillis(1'700'000'000'000ULL);
  r.last_activity  = r.created_at;
  r.instruction    = "do " + id;
  return r;
}

std::shared_ptr<SkeletonCache> BuildCache() {
  auto scanner = std::make_shared<MemoryRecordScanner>();

  auto leaf = MakeRecord("leaf", std::string("middle"));
  leaf.outline.push_back(MakeContent(EntryKind::kUserText, "Hello"));
  leaf.outline.push_back(MakeContent(EntryKind::kAssistantText, "Hi there"));
  leaf.outline.push_back(MakeContent(EntryKind::kToolCall, "read_file a.txt", "read_file"));
  leaf.outline.push_back(MakeContent(EntryKind::kToolResult, "contents", "read_file"));
  leaf.outline.push_back(MakeContent(EntryKind::kUserText, "   "));
  leaf.outline.push_back(MakeContent(EntryKind::kUserText, std::string(2000, 'x')));
  leaf.outline.push_back(MakeContent(EntryKind::kAssistantText, "bye"));
  scanner->Put(leaf);

  scanner->Put(MakeRecord("middle", std::string("top")));
  scanner->Put(MakeRecord("top", std::nullopt));

  auto cache = std::make_shared<SkeletonCache>(scanner);
  cache->EnsureFresh();
  return cache;
}

void TestGroupsAndSplitsEntries() {
  ChunkExtractor extractor(BuildCache());
  const auto     chunks = extractor.Extract("leaf");

  assert(chunks.size() == 6);

  assert(chunks[0].type == ChunkType::kMessageExchange);
  assert(chunks[0].content == "Hello\n\nHi there");
  assert(chunks[0].role == "mixed");
  assert(chunks[0].indexed);

  assert(chunks[1].type == ChunkType::kToolInteraction);
  assert(chunks[1].content == "read_file a.txt\n\ncontents");
  assert(!chunks[1].indexed);

  for (std::size_t i = 2; i < 5; ++i) {
    assert(chunks[i].sequence_order == 2);
    assert(chunks[i].chunk_index == i - 2);
    assert(chunks[i].total_chunks == 3);
    assert(chunks[i].role == "user");
    assert(chunks[i].content.size() <= 800);
  }
  assert(chunks[2].content.size() + chunks[3].content.size() + chunks[4].content.size() == 2000);

  assert(chunks[5].content == "bye");
  assert(chunks[5].sequence_order == 3);
  assert(chunks[5].role == "assistant");

  std::set<std::string> ids;
  for (const auto& c : chunks) ids.insert(c.chunk_id);
  assert(ids.size() == chunks.size());
}

void TestChunkIdsAreStable() {
  ChunkExtractor extractor(BuildCache());
  const auto     first  = extractor.Extract("leaf");
  const auto     second = extractor.Extract("leaf");
  assert(first.size() == second.size());
  for (std::size_t i = 0; i < first.size(); ++i) {
    assert(first[i].chunk_id == second[i].chunk_id);
  }
}

void TestPayloadCarriesRelationships() {
  ChunkExtractor extractor(BuildCache());
  const auto     chunks = extractor.Extract("leaf");
  const auto&    f      = chunks[0].payload.fields();

  assert(f.at("task_id").string_value() == "leaf");
  assert(f.at("parent_task_id").string_value() == "middle");
  assert(f.at("root_task_id").string_value() == "top");
  assert(f.at("chunk_type").string_value() == "message_exchange");
  assert(f.at("workspace").string_value() == "ws");
  assert(f.at("task_title").string_value() == "Title leaf");
  assert(f.at("sequence_order").number_value() == 0);
  assert(f.at("indexed").bool_value());
  assert(f.at("content_summary").string_value() == "Hello\n\nHi there");
  assert(f.at("host_os").kind_case() == google::protobuf::Value::KIND_NOT_SET);
  assert(!f.at("timestamp").string_value().empty());

  // A top-level task has null relationships.
  auto cache = BuildCache();
  auto top   = cache->Get("top");
  assert(top.has_value());
  top->outline.push_back({MakeContent(EntryKind::kUserText, "start"), 5, false});
  const auto top_chunks = extractor.Extract(*top, std::nullopt, std::nullopt);
  assert(top_chunks.size() == 1);
  assert(top_chunks[0].payload.fields().at("parent_task_id").kind_case() == google::protobuf::Value::kNullValue);
}

void TestSummaryNeverSplitsMultibyteCharacter() {
  auto scanner = std::make_shared<MemoryRecordScanner>();

  // "é" occupies bytes 199-200, straddling the 200-byte summary limit.
  auto straddling = MakeRecord("accented", std::nullopt);
  straddling.outline.push_back(MakeContent(EntryKind::kUserText, std::string(199, 'a') + "\xC3\xA9\xE2\x80\xA6"));
  scanner->Put(straddling);

  auto fitting = MakeRecord("fitting", std::nullopt);
  fitting.outline.push_back(MakeContent(EntryKind::kUserText, std::string(198, 'a') + "\xC3\xA9 suite"));
  scanner->Put(fitting);

  auto cache = std::make_shared<SkeletonCache>(scanner);
  cache->EnsureFresh();
  ChunkExtractor extractor(cache);

  const auto chunks = extractor.Extract("accented");
  assert(chunks.size() == 1);
  const auto& summary = chunks[0].payload.fields().at("content_summary").string_value();
  assert(summary == std::string(199, 'a'));

  // The payload must survive a wire round trip.
  google::protobuf::Struct reparsed;
  assert(reparsed.ParseFromString(chunks[0].payload.SerializeAsString()));
  assert(reparsed.fields().at("content_summary").string_value() == summary);

  const auto whole = extractor.Extract("fitting");
  assert(whole.size() == 1);
  assert(whole[0].payload.fields().at("content_summary").string_value() == std::string(198, 'a') + "\xC3\xA9");
}

void TestMissingTaskYieldsNothing() {
  ChunkExtractor extractor(BuildCache());
  assert(extractor.Extract("unknown").empty());
  // Tasks with no outline produce no chunks.
  assert(extractor.Extract("top").empty());
}

void TestSplitTextPrefersWhitespace() {
  const auto pieces = SplitText("aaa bbb ccc", 7);
  assert(pieces.size() == 2);
  assert(pieces[0] == "aaa bbb");
  assert(pieces[1] == "ccc");

  const auto hard = SplitText(std::string(10, 'z'), 4);
  assert(hard.size() == 3);
  assert(hard[2] == "zz");

  assert(SplitText("short", 100).size() == 1);
}

} // namespace

int main() {
  TestGroupsAndSplitsEntries();
  TestChunkIdsAreStable();
  TestPayloadCarriesRelationships();
  TestSummaryNeverSplitsMultibyteCharacter();
  TestMissingTaskYieldsNothing();
  TestSplitTextPrefersWhitespace();

  std::cout << "tasktree_unit_chunk_extractor: pass\n";
  return 0;
}
