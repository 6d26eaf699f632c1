#include "internal/hierarchy/hierarchy_resolver.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/skeleton/delegation.hpp"

namespace {

using namespace std::chrono_literals;
using tasktree::hierarchy::HierarchyResolver;
using tasktree::hierarchy::ResolutionMethod;
using tasktree::hierarchy::ResolverOptions;
using tasktree::skeleton::EntryKind;
using tasktree::skeleton::MakeContent;
using tasktree::skeleton::OutlineContent;
using tasktree::skeleton::SkeletonMap;
using tasktree::skeleton::TaskRecord;

const auto kEpoch = tasktree::util::FromUnixMillis(1'700'000'000'000ULL);

struct TaskSeed {
  std::string                 id;
  std::string                 workspace = "ws";
  std::chrono::minutes        created{0};
  std::string                 instruction;
  std::optional<std::string>  parent;
  std::vector<OutlineContent> outline;
};

void Add(SkeletonMap& map, TaskSeed seed) {
  TaskRecord r;
  r.task_id        = seed.id;
  r.workspace      = seed.workspace;
  r.title          = seed.id;
  r.created_at     = kEpoch + seed.created;
  r.last_activity  = r.created_at;
  r.instruction    = seed.instruction;
  r.parent_task_id = seed.parent;
  r.outline        = std::move(seed.outline);
  map[r.task_id]   = tasktree::skeleton::BuildSkeleton(r);
}

OutlineContent Delegates(const std::string& message) {
  return MakeContent(EntryKind::kAssistantText, "Delegating now.\n<new_task>\n<mode>code</mode>\n<message>" + message + "</message>\n</new_task>");
}

void TestExplicitParentWins() {
  SkeletonMap map;
  Add(map, {"parent", "ws", 0min, "Plan the release", std::nullopt, {Delegates("Fix the bug in module Y")}});
  Add(map, {"child", "ws", 5min, "Fix the bug in module Y", std::string("parent"), {}});

  const auto forest = HierarchyResolver().Resolve(map);
  const auto& r     = forest.records.at("child");
  assert(r.method == ResolutionMethod::kExplicit);
  assert(r.confidence == 1.0);
  assert(r.parent_task_id == std::optional<std::string>("parent"));
  assert(!r.declaration_ordinal.has_value());
}

void TestUniquePrefixMatch() {
  SkeletonMap map;
  Add(map, {"parent", "ws", 0min, "Plan the release", std::nullopt, {Delegates("Fix the bug in module Y")}});
  Add(map, {"child", "ws", 5min, "Fix the bug in module Y", std::nullopt, {}});

  const auto forest = HierarchyResolver().Resolve(map);
  const auto& r     = forest.records.at("child");
  assert(r.method == ResolutionMethod::kExactPrefixUnique);
  assert(r.confidence == 0.85);
  assert(r.parent_task_id == std::optional<std::string>("parent"));
  assert(r.declaration_ordinal == std::optional<std::size_t>(0));

  assert(forest.records.at("parent").method == ResolutionMethod::kRootFallback);
  assert(forest.phase1.parents_with_fragments == 1);
  assert(forest.phase1.fragments_indexed == 1);
  assert(forest.phase2.resolved == 1);
  assert(forest.phase2.roots == 1);
  assert(forest.children.at("parent") == std::vector<std::string>{"child"});
}

void TestLongerDeclarationCannotClaimShorterChild() {
  SkeletonMap map;
  Add(map, {"p", "other-ws", 0min, "A", std::nullopt, {Delegates("Fix the bug in module Y")}});
  Add(map, {"q", "ws", 1min, "B", std::nullopt, {Delegates("Fix the bug in module Y and then rewrite the whole build system")}});
  Add(map, {"a", "ws", 2min, "C", std::nullopt, {Delegates("Continue with the migration of the payment service to the new cluster")}});
  Add(map, {"child", "ws", 5min, "Fix the bug in module Y", std::nullopt, {}});
  Add(map, {"short", "ws", 5min, "continue", std::nullopt, {}});

  const auto forest = HierarchyResolver().Resolve(map);

  const auto& child = forest.records.at("child");
  assert(child.method == ResolutionMethod::kExactPrefixUnique);
  assert(child.parent_task_id == std::optional<std::string>("p"));

  const auto& lone = forest.records.at("short");
  assert(lone.method == ResolutionMethod::kRootFallback);
  assert(!lone.parent_task_id.has_value());
}

void TestDisambiguationDropsParentsCreatedAfterChild() {
  SkeletonMap map;
  Add(map, {"early", "other-ws", 0min, "A", std::nullopt, {Delegates("Run the migration script")}});
  Add(map, {"late", "ws", 10min, "B", std::nullopt, {Delegates("Run the migration script")}});
  Add(map, {"child-mid", "ws", 5min, "Run the migration script", std::nullopt, {}});
  Add(map, {"child-after", "ws", 20min, "Run the migration script", std::nullopt, {}});

  const auto forest = HierarchyResolver().Resolve(map);

  const auto& mid = forest.records.at("child-mid");
  assert(mid.method == ResolutionMethod::kExactPrefixDisambiguated);
  assert(mid.confidence == 0.65);
  assert(mid.parent_task_id == std::optional<std::string>("early"));

  // Both parents are older; the one in the child's workspace wins.
  const auto& after = forest.records.at("child-after");
  assert(after.method == ResolutionMethod::kExactPrefixDisambiguated);
  assert(after.parent_task_id == std::optional<std::string>("late"));
}

void TestAllCandidatesTooNewFallsBackToRoot() {
  SkeletonMap map;
  Add(map, {"p1", "ws", 10min, "A", std::nullopt, {Delegates("Write the changelog")}});
  Add(map, {"p2", "ws", 11min, "B", std::nullopt, {Delegates("Write the changelog")}});
  Add(map, {"child", "ws", 0min, "Write the changelog", std::nullopt, {}});

  const auto& r = HierarchyResolver().Resolve(map).records.at("child");
  assert(r.method == ResolutionMethod::kRootFallback);
  assert(r.confidence == 0.3);
  assert(!r.parent_task_id.has_value());
}

void TestSelectCandidateTieBreaks() {
  TaskRecord child_record;
  child_record.task_id    = "child";
  child_record.workspace  = "ws";
  child_record.created_at = kEpoch + 30min;
  const auto child        = tasktree::skeleton::BuildSkeleton(child_record);

  std::vector<tasktree::hierarchy::Candidate> candidates = {
      {"b", "ws", kEpoch, 32, 0},
      {"a", "ws", kEpoch, 32, 3},
      {"c", "ws", kEpoch, 48, 0},
  };
  assert(tasktree::hierarchy::SelectCandidate(child, candidates)->task_id == "c");

  candidates.pop_back();
  assert(tasktree::hierarchy::SelectCandidate(child, candidates)->task_id == "a");

  assert(!tasktree::hierarchy::SelectCandidate(child, {}).has_value());
}

void TestUnmatchedTaskIsRoot() {
  SkeletonMap map;
  Add(map, {"parent", "ws", 0min, "Plan the release", std::nullopt, {Delegates("Fix the bug in module Y")}});
  Add(map, {"loner", "ws", 5min, "Something nobody asked for", std::nullopt, {}});
  Add(map, {"empty", "ws", 5min, "", std::nullopt, {}});

  const auto forest = HierarchyResolver().Resolve(map);
  for (const auto* id : {"loner", "empty"}) {
    const auto& r = forest.records.at(id);
    assert(r.method == ResolutionMethod::kRootFallback);
    assert(r.confidence == 0.3);
    assert(!r.parent_task_id.has_value());
  }
  assert(forest.phase2.method_counts.at(ResolutionMethod::kRootFallback) == 3);
}

void TestStrictModeRejectsAmbiguity() {
  SkeletonMap map;
  Add(map, {"p1", "ws", 0min, "A", std::nullopt, {Delegates("Run the migration script")}});
  Add(map, {"p2", "ws", 1min, "B", std::nullopt, {Delegates("Run the migration script")}});
  Add(map, {"child", "ws", 5min, "Run the migration script", std::nullopt, {}});
  Add(map, {"p3", "ws", 0min, "C", std::nullopt, {Delegates("Profile the hot loop")}});
  Add(map, {"unique-child", "ws", 5min, "Profile the hot loop", std::nullopt, {}});

  ResolverOptions options;
  options.strict_mode = true;
  const auto forest   = HierarchyResolver(options).Resolve(map);

  assert(forest.strict_mode);
  assert(forest.records.at("child").method == ResolutionMethod::kRootFallback);
  assert(forest.records.at("unique-child").method == ResolutionMethod::kExactPrefixUnique);
  assert(forest.records.at("unique-child").parent_task_id == std::optional<std::string>("p3"));
}

void TestDanglingExplicitParentFallsThrough() {
  SkeletonMap map;
  Add(map, {"parent", "ws", 0min, "Plan", std::nullopt, {Delegates("Fix the bug in module Y")}});
  Add(map, {"orphan", "ws", 5min, "Unrelated request", std::string("ghost"), {}});
  Add(map, {"recovered", "ws", 5min, "Fix the bug in module Y", std::string("ghost"), {}});

  const auto forest = HierarchyResolver().Resolve(map);
  assert(forest.phase2.dangling_parents == 2);
  assert(forest.records.at("orphan").method == ResolutionMethod::kRootFallback);
  assert(forest.records.at("recovered").method == ResolutionMethod::kExactPrefixUnique);
  assert(forest.records.at("recovered").parent_task_id == std::optional<std::string>("parent"));
}

void TestInferredCycleIsBroken() {
  SkeletonMap map;
  Add(map, {"task-a", "ws", 0min, "Handle alpha work", std::nullopt, {Delegates("Handle beta work")}});
  Add(map, {"task-b", "ws", 0min, "Handle beta work", std::nullopt, {Delegates("Handle alpha work")}});

  const auto forest = HierarchyResolver().Resolve(map);
  assert(forest.phase2.cycles_broken == 1);
  // Equal confidence: the greater id is demoted.
  assert(forest.records.at("task-a").parent_task_id == std::optional<std::string>("task-b"));
  assert(!forest.records.at("task-b").parent_task_id.has_value());
  assert(forest.records.at("task-b").method == ResolutionMethod::kRootFallback);
}

void TestExplicitCycleIsBroken() {
  SkeletonMap map;
  Add(map, {"a", "ws", 0min, "", std::string("b"), {}});
  Add(map, {"b", "ws", 0min, "", std::string("a"), {}});

  const auto forest = HierarchyResolver().Resolve(map);
  assert(forest.phase2.cycles_broken == 1);
  assert(!forest.records.at("a").parent_task_id.has_value());
  assert(forest.records.at("b").parent_task_id == std::optional<std::string>("a"));
}

void TestChildrenFollowDeclarationOrder() {
  SkeletonMap map;
  Add(map, {"parent",
            "ws",
            0min,
            "Plan",
            std::nullopt,
            {Delegates("Step one"), MakeContent(EntryKind::kToolCall, "<message>Step two</message>", "new_task"),
             MakeContent(EntryKind::kToolCall, "Step three", "new_task")}});
  Add(map, {"third", "ws", 1min, "Step three", std::nullopt, {}});
  Add(map, {"second", "ws", 2min, "Step two", std::nullopt, {}});
  Add(map, {"first", "ws", 3min, "Step one", std::nullopt, {}});
  Add(map, {"explicit", "ws", 0min, "", std::string("parent"), {}});

  const auto fragments = tasktree::skeleton::ExtractDelegationFragments(map.at("parent"));
  assert(fragments.size() == 3);

  const auto forest = HierarchyResolver().Resolve(map);
  const std::vector<std::string> expected = {"first", "second", "third", "explicit"};
  assert(forest.children.at("parent") == expected);
  assert(forest.records.at("second").declaration_ordinal == std::optional<std::size_t>(1));
}

void TestResolutionIsDeterministic() {
  SkeletonMap map;
  Add(map, {"early", "other-ws", 0min, "A", std::nullopt, {Delegates("Run the migration script")}});
  Add(map, {"late", "ws", 10min, "B", std::nullopt, {Delegates("Run the migration script")}});
  Add(map, {"child", "ws", 20min, "Run the migration script", std::nullopt, {}});
  Add(map, {"task-a", "ws", 0min, "Handle alpha work", std::nullopt, {Delegates("Handle beta work")}});
  Add(map, {"task-b", "ws", 0min, "Handle beta work", std::nullopt, {Delegates("Handle alpha work")}});

  HierarchyResolver resolver;
  const auto first  = resolver.Resolve(map);
  const auto second = resolver.Resolve(map);
  assert(first.records == second.records);
  assert(first.children == second.children);
}

} // namespace

int main() {
  TestExplicitParentWins();
  TestUniquePrefixMatch();
  TestLongerDeclarationCannotClaimShorterChild();
  TestDisambiguationDropsParentsCreatedAfterChild();
  TestAllCandidatesTooNewFallsBackToRoot();
  TestSelectCandidateTieBreaks();
  TestUnmatchedTaskIsRoot();
  TestStrictModeRejectsAmbiguity();
  TestDanglingExplicitParentFallsThrough();
  TestInferredCycleIsBroken();
  TestExplicitCycleIsBroken();
  TestChildrenFollowDeclarationOrder();
  TestResolutionIsDeterministic();

  std::cout << "tasktree_unit_hierarchy_resolver: pass\n";
  return 0;
}
