#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/indexing/chunk.hpp"
#include "internal/skeleton/skeleton_cache.hpp"

namespace tasktree::indexing {

struct ChunkExtractorOptions {
  std::size_t max_chunk_chars = kDefaultMaxChunkChars;
};

/*
  ChunkExtractor

  Slices a task's outline into bounded chunks. Consecutive entries of the
  same chunk type share a chunk while they fit; an entry longer than the
  limit is split on whitespace (hard split when there is none) and its
  pieces carry chunk_index / total_chunks.

  A missing task yields an empty list and a log line, never an exception.
*/
class ChunkExtractor {
 public:
  ChunkExtractor(std::shared_ptr<skeleton::SkeletonCache> cache, ChunkExtractorOptions options = {});

  std::vector<Chunk> Extract(const std::string& task_id) const;

  // parent / root: relationship fields of the payload, null when unset.
  std::vector<Chunk> Extract(const skeleton::TaskSkeleton& skeleton, const std::optional<std::string>& parent_task_id,
                             const std::optional<std::string>& root_task_id) const;

 private:
  std::shared_ptr<skeleton::SkeletonCache> cache_;
  ChunkExtractorOptions                    options_;
};

// Splits `text` into pieces of at most `max_chars` bytes.
std::vector<std::string> SplitText(std::string_view text, std::size_t max_chars);

} // namespace tasktree::indexing
