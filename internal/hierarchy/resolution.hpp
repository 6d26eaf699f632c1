#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tasktree::hierarchy {

enum class ResolutionMethod {
  kExplicit,
  kExactPrefixUnique,
  kExactPrefixDisambiguated,
  kRootFallback,
};

inline constexpr double kExplicitConfidence      = 1.0;
inline constexpr double kUniqueConfidence        = 0.85;
inline constexpr double kDisambiguatedConfidence = 0.65;
inline constexpr double kRootFallbackConfidence  = 0.3;

// "explicit", "exact_prefix_unique", "exact_prefix_disambiguated", "root_fallback"
std::string_view MethodName(ResolutionMethod method);

struct ResolutionRecord {
  // Unset for roots.
  std::optional<std::string> parent_task_id;
  ResolutionMethod           method     = ResolutionMethod::kRootFallback;
  double                     confidence = kRootFallbackConfidence;

  // Position of the matching fragment in the parent's declarations
  // (prefix-inferred edges only). Orders siblings.
  std::optional<std::size_t> declaration_ordinal;
  std::size_t                matched_prefix_length = 0;

  bool operator==(const ResolutionRecord&) const = default;
};

using ResolutionMap = std::map<std::string, ResolutionRecord>;
using ChildrenMap   = std::map<std::string, std::vector<std::string>>;

struct Phase1Stats {
  std::size_t skeletons_processed    = 0;
  std::size_t parents_with_fragments = 0;
  std::size_t fragments_indexed      = 0;
};

struct Phase2Stats {
  std::size_t processed         = 0;
  std::size_t resolved          = 0;
  std::size_t roots             = 0;
  std::size_t dangling_parents  = 0;
  std::size_t cycles_broken     = 0;
  double      average_confidence = 0.0;

  std::map<ResolutionMethod, std::size_t> method_counts;
};

/*
  Output of one reconstruction pass. Children lists are ordered by
  declaration ordinal, then creation time, then task id.
*/
struct ResolvedForest {
  ResolutionMap records;
  ChildrenMap   children;

  Phase1Stats phase1;
  Phase2Stats phase2;
  bool        strict_mode = false;
};

} // namespace tasktree::hierarchy
