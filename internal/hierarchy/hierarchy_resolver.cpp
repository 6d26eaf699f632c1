#include "internal/hierarchy/hierarchy_resolver.hpp"

#include <algorithm>
#include <exception>
#include <set>

#include "internal/observability/logging.hpp"
#include "internal/skeleton/delegation.hpp"

namespace tasktree::hierarchy {

using observability::BoolField;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

ResolutionRecord Root() {
  return ResolutionRecord{};
}

std::int64_t AsInt(std::size_t v) {
  return static_cast<std::int64_t>(v);
}

} // namespace

std::string_view MethodName(ResolutionMethod method) {
  switch (method) {
    case ResolutionMethod::kExplicit:
      return "explicit";
    case ResolutionMethod::kExactPrefixUnique:
      return "exact_prefix_unique";
    case ResolutionMethod::kExactPrefixDisambiguated:
      return "exact_prefix_disambiguated";
    case ResolutionMethod::kRootFallback:
      return "root_fallback";
  }
  return "unknown";
}

std::optional<Candidate> SelectCandidate(const skeleton::TaskSkeleton& child, std::vector<Candidate> candidates) {
  // A parent must exist before its child.
  candidates.erase(std::remove_if(candidates.begin(), candidates.end(), [&](const Candidate& c) { return c.created_at > child.created_at; }),
                   candidates.end());
  if (candidates.empty()) {
    return std::nullopt;
  }

  auto better = [&](const Candidate& a, const Candidate& b) {
    const bool a_same = a.workspace == child.workspace;
    const bool b_same = b.workspace == child.workspace;
    if (a_same != b_same) return a_same;
    if (a.matched_prefix_length != b.matched_prefix_length) return a.matched_prefix_length > b.matched_prefix_length;
    return a.task_id < b.task_id;
  };
  return *std::min_element(candidates.begin(), candidates.end(), better);
}

HierarchyResolver::HierarchyResolver(ResolverOptions options) : options_(options) {
  if (options_.prefix_length == 0) {
    options_.prefix_length = text::kDefaultPrefixLength;
  }
}

// ---------------------------------------------------------------------------
// Phase 1
// ---------------------------------------------------------------------------

Phase1Stats HierarchyResolver::IndexFragments(const skeleton::SkeletonMap& skeletons, index::PrefixIndex& index) const {
  Phase1Stats stats;

  for (const auto& [id, s] : skeletons) {
    ++stats.skeletons_processed;

    std::size_t indexed = 0;
    try {
      for (const auto& fragment : skeleton::ExtractDelegationFragments(s)) {
        if (index.Insert(id, fragment)) ++indexed;
      }
    } catch (const std::exception& e) {
      TASKTREE_LOG_WARN("Skipping delegation fragments of malformed task", {StringField("task_id", id), StringField("error", e.what())});
    }

    if (indexed > 0) {
      ++stats.parents_with_fragments;
      stats.fragments_indexed += indexed;
    }
  }

  return stats;
}

// ---------------------------------------------------------------------------
// Phase 2
// ---------------------------------------------------------------------------

ResolutionRecord HierarchyResolver::ResolveOne(const skeleton::TaskSkeleton& child, const skeleton::SkeletonMap& skeletons, const index::PrefixIndex& index,
                                               bool* dangling) const {
  if (dangling) *dangling = false;

  if (child.parent_task_id && *child.parent_task_id != child.task_id) {
    if (skeletons.count(*child.parent_task_id) > 0) {
      ResolutionRecord r;
      r.parent_task_id = child.parent_task_id;
      r.method         = ResolutionMethod::kExplicit;
      r.confidence     = kExplicitConfidence;
      return r;
    }
    if (dangling) *dangling = true;
  }

  if (child.instruction.empty()) {
    return Root();
  }

  std::vector<Candidate> candidates;
  for (const auto& hit : index.SearchExactPrefix(child.instruction, options_.prefix_length)) {
    if (hit.task_id == child.task_id) continue;
    auto it = skeletons.find(hit.task_id);
    if (it == skeletons.end()) continue;
    candidates.push_back(Candidate{hit.task_id, it->second.workspace, it->second.created_at, hit.matched_prefix_length, hit.declaration_ordinal});
  }

  if (candidates.empty()) {
    return Root();
  }

  if (candidates.size() == 1) {
    ResolutionRecord r;
    r.parent_task_id        = candidates.front().task_id;
    r.method                = ResolutionMethod::kExactPrefixUnique;
    r.confidence            = kUniqueConfidence;
    r.declaration_ordinal   = candidates.front().declaration_ordinal;
    r.matched_prefix_length = candidates.front().matched_prefix_length;
    return r;
  }

  if (options_.strict_mode) {
    return Root();
  }

  auto winner = SelectCandidate(child, std::move(candidates));
  if (!winner) {
    return Root();
  }

  ResolutionRecord r;
  r.parent_task_id        = winner->task_id;
  r.method                = ResolutionMethod::kExactPrefixDisambiguated;
  r.confidence            = kDisambiguatedConfidence;
  r.declaration_ordinal   = winner->declaration_ordinal;
  r.matched_prefix_length = winner->matched_prefix_length;
  return r;
}

std::size_t HierarchyResolver::BreakCycles(ResolutionMap& records) const {
  std::size_t broken = 0;

  // 0 = unvisited, 1 = on the current walk, 2 = done
  std::map<std::string, int> state;

  for (const auto& [start, unused] : records) {
    if (state[start] != 0) continue;

    std::vector<std::string> path;
    std::string              current = start;
    for (;;) {
      auto& st = state[current];
      if (st == 2) break;
      if (st == 1) {
        // current closes a cycle: path from its position to the end.
        auto cycle_begin = std::find(path.begin(), path.end(), current);
        std::vector<std::string> cycle(cycle_begin, path.end());

        std::optional<std::string> victim;
        for (const auto& id : cycle) {
          const auto& r = records.at(id);
          if (r.method == ResolutionMethod::kExplicit) continue;
          if (!victim) {
            victim = id;
            continue;
          }
          const auto& best = records.at(*victim);
          if (r.confidence < best.confidence || (r.confidence == best.confidence && id > *victim)) {
            victim = id;
          }
        }
        if (!victim) {
          victim = *std::min_element(cycle.begin(), cycle.end());
        }

        TASKTREE_LOG_WARN("Breaking parent cycle", {StringField("task_id", *victim), StringField("parent_task_id", records.at(*victim).parent_task_id.value_or("")),
                                                    IntField("cycle_length", AsInt(cycle.size()))});
        records[*victim] = Root();
        ++broken;
        break;
      }

      st = 1;
      path.push_back(current);

      const auto& r = records.at(current);
      if (!r.parent_task_id || records.count(*r.parent_task_id) == 0) break;
      current = *r.parent_task_id;
    }

    for (const auto& id : path) state[id] = 2;
  }

  return broken;
}

ChildrenMap BuildChildren(const ResolutionMap& records, const skeleton::SkeletonMap& skeletons) {
  ChildrenMap children;
  for (const auto& [id, r] : records) {
    if (r.parent_task_id) children[*r.parent_task_id].push_back(id);
  }

  for (auto& [parent, list] : children) {
    std::sort(list.begin(), list.end(), [&](const std::string& a, const std::string& b) {
      const auto& ra = records.at(a);
      const auto& rb = records.at(b);
      if (ra.declaration_ordinal.has_value() != rb.declaration_ordinal.has_value()) return ra.declaration_ordinal.has_value();
      if (ra.declaration_ordinal && *ra.declaration_ordinal != *rb.declaration_ordinal) return *ra.declaration_ordinal < *rb.declaration_ordinal;

      const auto& ca = skeletons.at(a).created_at;
      const auto& cb = skeletons.at(b).created_at;
      if (ca != cb) return ca < cb;
      return a < b;
    });
  }
  return children;
}

ResolvedForest HierarchyResolver::Resolve(const skeleton::SkeletonMap& skeletons) const {
  ResolvedForest forest;
  forest.strict_mode = options_.strict_mode;

  index::PrefixIndex index(options_.prefix_length);
  forest.phase1 = IndexFragments(skeletons, index);

  TASKTREE_LOG_INFO("Hierarchy phase 1 complete", {IntField("skeletons", AsInt(forest.phase1.skeletons_processed)),
                                                   IntField("parents_with_fragments", AsInt(forest.phase1.parents_with_fragments)),
                                                   IntField("fragments_indexed", AsInt(forest.phase1.fragments_indexed))});

  auto& stats = forest.phase2;
  for (const auto& [id, s] : skeletons) {
    ++stats.processed;
    bool dangling = false;
    try {
      forest.records[id] = ResolveOne(s, skeletons, index, &dangling);
    } catch (const std::exception& e) {
      TASKTREE_LOG_WARN("Resolution failed; treating task as root", {StringField("task_id", id), StringField("error", e.what())});
      forest.records[id] = Root();
    }
    if (dangling) ++stats.dangling_parents;
  }

  stats.cycles_broken = BreakCycles(forest.records);

  double confidence_sum = 0.0;
  for (const auto& [id, r] : forest.records) {
    ++stats.method_counts[r.method];
    if (r.parent_task_id) {
      ++stats.resolved;
      confidence_sum += r.confidence;
    } else {
      ++stats.roots;
    }
  }
  stats.average_confidence = stats.resolved > 0 ? confidence_sum / static_cast<double>(stats.resolved) : 0.0;

  forest.children = BuildChildren(forest.records, skeletons);

  TASKTREE_LOG_INFO("Hierarchy phase 2 complete",
                    {IntField("processed", AsInt(stats.processed)), IntField("resolved", AsInt(stats.resolved)), IntField("roots", AsInt(stats.roots)),
                     IntField("dangling_parents", AsInt(stats.dangling_parents)), IntField("cycles_broken", AsInt(stats.cycles_broken)),
                     DoubleField("average_confidence", stats.average_confidence), BoolField("strict_mode", options_.strict_mode)});

  return forest;
}

} // namespace tasktree::hierarchy
