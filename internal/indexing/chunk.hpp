#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "google/protobuf/struct.pb.h"

namespace tasktree::indexing {

enum class ChunkType {
  // user / assistant text; embedded and searchable
  kMessageExchange,
  // tool calls and results; kept for context, not embedded
  kToolInteraction,
};

std::string_view ChunkTypeName(ChunkType type);

inline constexpr std::size_t kDefaultMaxChunkChars = 800;
inline constexpr std::size_t kContentSummaryChars  = 200;

struct Chunk {
  std::string chunk_id;
  std::string task_id;
  ChunkType   type = ChunkType::kMessageExchange;

  std::size_t sequence_order = 0;
  std::size_t chunk_index    = 0;
  std::size_t total_chunks   = 1;

  std::string role;
  std::string content;
  bool        indexed = true;

  google::protobuf::Struct payload;
};

} // namespace tasktree::indexing
