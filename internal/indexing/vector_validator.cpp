#include "internal/indexing/vector_validator.hpp"

#include <cmath>

namespace tasktree::indexing {

std::optional<std::string> ValidateVector(const std::vector<float>& vector, std::size_t expected_dimensions) {
  if (vector.empty()) {
    return std::string("empty vector");
  }
  if (vector.size() != expected_dimensions) {
    return "dimension mismatch: expected " + std::to_string(expected_dimensions) + ", got " + std::to_string(vector.size());
  }
  for (std::size_t i = 0; i < vector.size(); ++i) {
    if (std::isnan(vector[i])) {
      return "NaN component at index " + std::to_string(i);
    }
    if (std::isinf(vector[i])) {
      return "infinite component at index " + std::to_string(i);
    }
  }
  return std::nullopt;
}

} // namespace tasktree::indexing
