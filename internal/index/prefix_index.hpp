#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/text/canonicalizer.hpp"

namespace tasktree::index {

struct PrefixMatch {
  std::string task_id;
  std::size_t matched_prefix_length = 0;
  // Position of the matching fragment in the parent's declaration order.
  std::size_t declaration_ordinal = 0;
};

struct PrefixIndexStats {
  std::size_t total_instructions = 0;
  std::size_t total_nodes        = 0;
  std::size_t total_parents      = 0;
};

/*
  PrefixIndex

  Character trie over canonical delegation fragments. Every key that
  terminates at a node remembers the parents that declared it, together
  with the ordinal of that declaration inside the parent.

  Lookup walks decreasing prefix lengths (K, K-16, ..., 16) and stops at
  the longest length that produces at least one hit. A stored fragment
  hits at length L when its first L canonical characters equal the
  child's first L, both sides cut to L. A child shorter than L therefore
  only matches fragments identical to it.

  Not thread-safe. The resolver builds and queries it on one thread.
*/
class PrefixIndex {
 public:
  explicit PrefixIndex(std::size_t prefix_length = text::kDefaultPrefixLength);

  // Canonicalizes the fragment and records it for task_id. Empty
  // fragments are ignored. Returns true when something was stored.
  bool Insert(const std::string& task_id, std::string_view fragment_text);

  std::vector<PrefixMatch> SearchExactPrefix(std::string_view child_text) const;
  std::vector<PrefixMatch> SearchExactPrefix(std::string_view child_text, std::size_t k) const;

  // Canonical prefixes declared by task_id, in insertion order.
  std::vector<std::string> GetInstructionsByParent(const std::string& task_id) const;

  bool ValidateParentChildRelation(std::string_view child_text, const std::string& parent_id) const;

  PrefixIndexStats GetStats() const;

  void Clear();

  std::size_t PrefixLength() const {
    return prefix_length_;
  }

 private:
  struct Declaration {
    std::string task_id;
    std::size_t ordinal;
  };

  struct Node {
    std::map<char, std::size_t> children;
    std::vector<Declaration>    declarations;
  };

  std::optional<std::size_t> Walk(std::string_view key) const;
  void CollectSubtree(std::size_t node, std::map<std::string, std::size_t>& ordinals) const;

  std::size_t prefix_length_;

  std::vector<Node>                                         nodes_;
  std::unordered_map<std::string, std::vector<std::string>> by_parent_;
  std::size_t                                               total_instructions_ = 0;
};

} // namespace tasktree::index
