#include "fileweave/chunking/chunker.hpp"

#include "fileweave/common/utf8.hpp"

namespace fileweave::chunking {

FixedSizeChunker::FixedSizeChunker(ChunkingConfig config) : config_(config) {}

std::vector<std::size_t> FixedSizeChunker::find_boundaries(const std::string_view content) const {
  auto starts = fixed_window_starts(common::char_boundaries(content), 0, content.size(),
                                    config_.max_chunk_size);
  starts.push_back(content.size());
  return starts;
}

common::Result<std::vector<DocumentChunk>>
FixedSizeChunker::chunk(const std::string_view content) const {
  if (auto valid = require_valid_text(content); !valid.ok()) {
    return common::Result<std::vector<DocumentChunk>>::failure(valid.error_info());
  }

  const auto char_table = common::char_boundaries(content);
  const auto cuts = find_boundaries(content);

  std::vector<DocumentChunk> chunks;
  for (std::size_t i = 0; i + 1 < cuts.size(); ++i) {
    chunks.push_back(make_chunk(content, {cuts[i], cuts[i + 1]}, chunks.size(), char_table));
  }

  apply_overlap(chunks, content);
  if (auto finalized = finalize_chunks(chunks); !finalized.ok()) {
    return common::Result<std::vector<DocumentChunk>>::failure(finalized.error_info());
  }
  return common::Result<std::vector<DocumentChunk>>::success(std::move(chunks));
}

void FixedSizeChunker::apply_overlap(std::vector<DocumentChunk> &chunks,
                                     const std::string_view original) const {
  apply_trailing_overlap(chunks, original, config_.overlap_size);
}

} // namespace fileweave::chunking
