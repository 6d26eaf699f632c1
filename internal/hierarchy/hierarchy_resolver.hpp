#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/hierarchy/resolution.hpp"
#include "internal/index/prefix_index.hpp"
#include "internal/skeleton/skeleton_cache.hpp"

namespace tasktree::hierarchy {

struct ResolverOptions {
  std::size_t prefix_length = text::kDefaultPrefixLength;
  // Accept only explicit parents and unique prefix matches.
  bool strict_mode = false;
};

// A parent proposed by the prefix index for one child.
struct Candidate {
  std::string     task_id;
  std::string     workspace;
  util::TimePoint created_at;
  std::size_t     matched_prefix_length = 0;
  std::size_t     declaration_ordinal   = 0;
};

/*
  Picks the parent among several prefix matches, or nothing.

    1. candidates created after the child are discarded
    2. same workspace as the child first
    3. longer matched prefix first
    4. smallest task id

  Pure and total: same input, same answer.
*/
std::optional<Candidate> SelectCandidate(const skeleton::TaskSkeleton& child, std::vector<Candidate> candidates);

/*
  HierarchyResolver

  Phase 1 indexes every skeleton's delegation fragments. Phase 2 assigns
  each task a parent (explicit reference, unique prefix match,
  disambiguated prefix match) or marks it a root. A final pass breaks any
  cycle the inferred edges introduced.

  Runs single-threaded over an immutable snapshot and never throws for a
  single bad skeleton.
*/
class HierarchyResolver {
 public:
  explicit HierarchyResolver(ResolverOptions options = {});

  ResolvedForest Resolve(const skeleton::SkeletonMap& skeletons) const;

  Phase1Stats IndexFragments(const skeleton::SkeletonMap& skeletons, index::PrefixIndex& index) const;

  // Returns the record and whether an explicit parent was dangling.
  ResolutionRecord ResolveOne(const skeleton::TaskSkeleton& child, const skeleton::SkeletonMap& skeletons, const index::PrefixIndex& index,
                              bool* dangling = nullptr) const;

  const ResolverOptions& Options() const {
    return options_;
  }

 private:
  std::size_t BreakCycles(ResolutionMap& records) const;

  ResolverOptions options_;
};

ChildrenMap BuildChildren(const ResolutionMap& records, const skeleton::SkeletonMap& skeletons);

} // namespace tasktree::hierarchy
