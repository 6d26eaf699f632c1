#include "internal/indexing/hashing_embedding_service.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <string_view>

#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace tasktree::indexing {

namespace {

std::vector<std::string> Tokenize(std::string_view text) {
  std::vector<std::string> tokens;
  std::string              current;
  current.reserve(32);

  for (const unsigned char ch : text) {
    if (std::isalnum(ch) != 0) {
      current.push_back(static_cast<char>(std::tolower(ch)));
      continue;
    }
    if (!current.empty()) {
      tokens.push_back(current);
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(current);
  }
  return tokens;
}

void NormalizeL2(std::vector<float>& v) {
  double sum_sq = 0.0;
  for (const auto x : v) {
    sum_sq += static_cast<double>(x) * static_cast<double>(x);
  }
  if (sum_sq <= 0.0) {
    return;
  }
  const auto inv_norm = 1.0 / std::sqrt(sum_sq);
  for (auto& x : v) {
    x = static_cast<float>(static_cast<double>(x) * inv_norm);
  }
}

} // namespace

HashingEmbeddingService::HashingEmbeddingService(std::size_t dimensions) : dimensions_(dimensions) {
  if (dimensions_ == 0) {
    throw util::InvalidArgument("embedding dimensions must be positive");
  }
}

std::vector<float> HashingEmbeddingService::EmbedOne(const std::string& text) const {
  std::vector<float> embedding(dimensions_, 0.0F);

  for (const auto& token : Tokenize(text)) {
    const auto  hash  = util::Fnv1a64(token);
    const auto  index = static_cast<std::size_t>(hash % static_cast<std::uint64_t>(dimensions_));
    const float sign  = ((hash >> 63U) != 0U) ? -1.0F : 1.0F;
    embedding[index] += sign;
  }

  NormalizeL2(embedding);
  return embedding;
}

std::vector<std::vector<float>> HashingEmbeddingService::Embed(const std::vector<std::string>& texts) {
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  for (const auto& text : texts) {
    out.push_back(EmbedOne(text));
  }
  return out;
}

} // namespace tasktree::indexing
