#include "fileweave/chunking/chunker.hpp"

#include "fileweave/common/hash.hpp"
#include "fileweave/common/utf8.hpp"

#include <algorithm>

namespace fileweave::chunking {

common::Status require_valid_text(const std::string_view content) {
  if (const auto offset = common::find_invalid_utf8(content); offset.has_value()) {
    return common::Status::failure(
        common::make_error(common::ErrorKind::EncodingError,
                           "invalid UTF-8 sequence at byte offset " + std::to_string(*offset)));
  }
  return common::Status::success();
}

DocumentChunk make_chunk(const std::string_view source, const ByteRange range,
                         const std::size_t index, const std::vector<std::size_t> &char_table) {
  DocumentChunk chunk;
  chunk.content = std::string(source.substr(range.first, range.second - range.first));
  chunk.content_hash = common::sha256_hex(chunk.content);
  chunk.metadata.chunk_index = index;
  chunk.metadata.byte_range = range;
  chunk.metadata.char_range = {common::char_index_of(char_table, range.first),
                               common::char_index_of(char_table, range.second)};
  return chunk;
}

common::Status finalize_chunks(std::vector<DocumentChunk> &chunks) {
  for (auto &chunk : chunks) {
    auto id = common::random_hex(16);
    if (!id.ok()) {
      return common::Status::failure(id.error_info());
    }
    chunk.id = std::move(id.value());
    chunk.metadata.total_chunks = chunks.size();
  }
  return common::Status::success();
}

std::vector<std::size_t> fixed_window_starts(const std::vector<std::size_t> &char_table,
                                             const std::size_t begin, const std::size_t end,
                                             const std::size_t max_bytes) {
  std::vector<std::size_t> starts;
  if (begin >= end) {
    return starts;
  }

  auto it = std::lower_bound(char_table.begin(), char_table.end(), begin);
  std::size_t window_start = begin;
  starts.push_back(window_start);
  for (; it != char_table.end() && *it < end; ++it) {
    const auto next = std::next(it);
    const std::size_t char_end = next == char_table.end() ? end : std::min(*next, end);
    if (char_end - window_start > max_bytes && *it > window_start) {
      window_start = *it;
      starts.push_back(window_start);
    }
  }
  return starts;
}

void apply_trailing_overlap(std::vector<DocumentChunk> &chunks, const std::string_view original,
                            const std::size_t overlap_size) {
  if (overlap_size == 0 || chunks.size() < 2) {
    return;
  }

  std::vector<std::size_t> own_starts;
  own_starts.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    own_starts.push_back(chunk.metadata.byte_range.first);
  }

  const auto char_table = common::char_boundaries(original);
  for (std::size_t i = 1; i < chunks.size(); ++i) {
    auto &meta = chunks[i].metadata;
    const std::size_t previous_start = own_starts[i - 1];
    const std::size_t cut = own_starts[i];
    std::size_t overlap_start = cut > overlap_size ? cut - overlap_size : 0;
    overlap_start = std::max(overlap_start, previous_start);
    // Snapping forward keeps the carried context within overlap_size bytes.
    overlap_start = common::ceil_char_boundary(original, overlap_start);
    if (overlap_start >= cut) {
      continue;
    }

    meta.byte_range.first = overlap_start;
    meta.char_range.first = common::char_index_of(char_table, overlap_start);
    chunks[i].content =
        std::string(original.substr(overlap_start, meta.byte_range.second - overlap_start));
    chunks[i].content_hash = common::sha256_hex(chunks[i].content);
  }
}

common::Result<std::unique_ptr<IChunker>> create_chunker(const ChunkingConfig &config) {
  if (auto valid = config.validate(); !valid.ok()) {
    return common::Result<std::unique_ptr<IChunker>>::failure(valid.error_info());
  }

  switch (config.strategy) {
  case ChunkStrategy::FixedSize:
    return common::Result<std::unique_ptr<IChunker>>::success(
        std::make_unique<FixedSizeChunker>(config));
  case ChunkStrategy::SentenceBoundary:
    return common::Result<std::unique_ptr<IChunker>>::success(
        std::make_unique<SentenceChunker>(config));
  case ChunkStrategy::ParagraphBoundary:
    return common::Result<std::unique_ptr<IChunker>>::success(
        std::make_unique<ParagraphChunker>(config));
  case ChunkStrategy::ConversationBreak:
  case ChunkStrategy::HtmlStructureAware:
  case ChunkStrategy::SemanticSimilarity:
    break;
  }
  return common::Result<std::unique_ptr<IChunker>>::failure(
      common::make_error(common::ErrorKind::Internal,
                         "chunk strategy not supported: " + chunk_strategy_to_string(config.strategy)));
}

} // namespace fileweave::chunking
