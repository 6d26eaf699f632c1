#pragma once

#include "internal/indexing/embedding_service.hpp"

namespace tasktree::indexing {

/*
  Deterministic feature-hashing embedder: lowercase alphanumeric tokens,
  FNV-1a into a signed bucket, L2 normalized. No network, no model.
*/
class HashingEmbeddingService final : public EmbeddingService {
 public:
  explicit HashingEmbeddingService(std::size_t dimensions);

  std::size_t Dimensions() const override {
    return dimensions_;
  }

  std::vector<std::vector<float>> Embed(const std::vector<std::string>& texts) override;

  std::vector<float> EmbedOne(const std::string& text) const;

 private:
  std::size_t dimensions_;
};

} // namespace tasktree::indexing
