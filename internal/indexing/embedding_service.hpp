#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace tasktree::indexing {

/*
  EmbeddingService

  One vector per input text, same order. Transient failures throw
  util::Unavailable, rejected input throws util::InvalidArgument.
*/
class EmbeddingService {
 public:
  virtual ~EmbeddingService() = default;

  virtual std::size_t Dimensions() const = 0;

  virtual std::vector<std::vector<float>> Embed(const std::vector<std::string>& texts) = 0;
};

} // namespace tasktree::indexing
