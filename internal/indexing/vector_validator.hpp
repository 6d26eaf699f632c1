#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tasktree::indexing {

// Returns a description of the problem, or nullopt when the vector is usable.
std::optional<std::string> ValidateVector(const std::vector<float>& vector, std::size_t expected_dimensions);

} // namespace tasktree::indexing
