#include "internal/index/prefix_index.hpp"

#include <algorithm>

namespace tasktree::index {

namespace {

constexpr std::size_t kLengthStep = 16;

// K, K-16, ..., down to 16.
std::vector<std::size_t> SearchLengths(std::size_t k) {
  std::vector<std::size_t> lengths;
  for (std::size_t len = k; len > kLengthStep; len -= kLengthStep) {
    lengths.push_back(len);
  }
  lengths.push_back(std::min(k, kLengthStep));
  return lengths;
}

} // namespace

PrefixIndex::PrefixIndex(std::size_t prefix_length) : prefix_length_(prefix_length == 0 ? text::kDefaultPrefixLength : prefix_length) {
  nodes_.emplace_back();
}

bool PrefixIndex::Insert(const std::string& task_id, std::string_view fragment_text) {
  const auto key = text::Canonicalize(fragment_text, prefix_length_);
  if (key.empty() || task_id.empty()) {
    return false;
  }

  std::size_t node = 0;
  for (const char c : key) {
    auto it = nodes_[node].children.find(c);
    if (it == nodes_[node].children.end()) {
      nodes_.emplace_back();
      const auto created = nodes_.size() - 1;
      nodes_[node].children.emplace(c, created);
      node = created;
    } else {
      node = it->second;
    }
  }

  auto& declared = by_parent_[task_id];
  const auto ordinal = declared.size();
  declared.push_back(key);
  ++total_instructions_;

  auto& declarations = nodes_[node].declarations;
  const bool already = std::any_of(declarations.begin(), declarations.end(), [&](const Declaration& d) { return d.task_id == task_id; });
  if (!already) {
    declarations.push_back(Declaration{task_id, ordinal});
  }
  return true;
}

std::optional<std::size_t> PrefixIndex::Walk(std::string_view key) const {
  std::size_t node = 0;
  for (const char c : key) {
    const auto& children = nodes_[node].children;
    auto it = children.find(c);
    if (it == children.end()) {
      return std::nullopt;
    }
    node = it->second;
  }
  return node;
}

void PrefixIndex::CollectSubtree(std::size_t node, std::map<std::string, std::size_t>& ordinals) const {
  std::vector<std::size_t> stack{node};
  while (!stack.empty()) {
    const auto current = stack.back();
    stack.pop_back();

    for (const auto& d : nodes_[current].declarations) {
      auto [it, inserted] = ordinals.emplace(d.task_id, d.ordinal);
      if (!inserted) {
        it->second = std::min(it->second, d.ordinal);
      }
    }
    for (const auto& [c, child] : nodes_[current].children) {
      stack.push_back(child);
    }
  }
}

std::vector<PrefixMatch> PrefixIndex::SearchExactPrefix(std::string_view child_text) const {
  return SearchExactPrefix(child_text, prefix_length_);
}

std::vector<PrefixMatch> PrefixIndex::SearchExactPrefix(std::string_view child_text, std::size_t k) const {
  if (k == 0) {
    k = prefix_length_;
  }

  const auto key = text::Canonicalize(child_text, k);
  if (key.empty()) {
    return {};
  }

  for (const auto len : SearchLengths(k)) {
    const auto m    = std::min(len, key.size());
    const auto node = Walk(std::string_view(key).substr(0, m));
    if (!node) {
      continue;
    }

    // A child shorter than len only equals fragments of exactly its own
    // length; anything deeper in the subtree is longer than the child.
    std::map<std::string, std::size_t> ordinals;
    if (m == len) {
      CollectSubtree(*node, ordinals);
    } else {
      for (const auto& d : nodes_[*node].declarations) {
        ordinals.emplace(d.task_id, d.ordinal);
      }
    }
    if (ordinals.empty()) {
      continue;
    }

    std::vector<PrefixMatch> hits;
    hits.reserve(ordinals.size());
    for (const auto& [task_id, ordinal] : ordinals) {
      hits.push_back(PrefixMatch{task_id, m, ordinal});
    }
    return hits;
  }

  return {};
}

std::vector<std::string> PrefixIndex::GetInstructionsByParent(const std::string& task_id) const {
  auto it = by_parent_.find(task_id);
  if (it == by_parent_.end()) {
    return {};
  }
  return it->second;
}

bool PrefixIndex::ValidateParentChildRelation(std::string_view child_text, const std::string& parent_id) const {
  const auto hits = SearchExactPrefix(child_text);
  return std::any_of(hits.begin(), hits.end(), [&](const PrefixMatch& m) { return m.task_id == parent_id; });
}

PrefixIndexStats PrefixIndex::GetStats() const {
  return PrefixIndexStats{total_instructions_, nodes_.size(), by_parent_.size()};
}

void PrefixIndex::Clear() {
  nodes_.clear();
  nodes_.emplace_back();
  by_parent_.clear();
  total_instructions_ = 0;
}

} // namespace tasktree::index
