#pragma once

#include "fileweave/chunking/types.hpp"
#include "fileweave/common/result.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace fileweave::chunking {

class IChunker {
public:
  virtual ~IChunker() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual ChunkStrategy strategy() const = 0;

  // Fails with EncodingError when content is not valid UTF-8. The returned
  // chunks carry overlap and back-filled total_chunks.
  [[nodiscard]] virtual common::Result<std::vector<DocumentChunk>>
  chunk(std::string_view content) const = 0;

  // Byte offsets where the strategy's units (windows, sentences, paragraphs)
  // begin, followed by content.size().
  [[nodiscard]] virtual std::vector<std::size_t> find_boundaries(std::string_view content) const = 0;

  virtual void apply_overlap(std::vector<DocumentChunk> &chunks,
                             std::string_view original) const = 0;
};

// Cuts at codepoint boundaries so that no window exceeds max_chunk_size bytes
// unless a single codepoint is wider than the limit.
class FixedSizeChunker final : public IChunker {
public:
  explicit FixedSizeChunker(ChunkingConfig config);

  [[nodiscard]] std::string_view name() const override { return "fixed_size"; }
  [[nodiscard]] ChunkStrategy strategy() const override { return ChunkStrategy::FixedSize; }
  [[nodiscard]] common::Result<std::vector<DocumentChunk>>
  chunk(std::string_view content) const override;
  [[nodiscard]] std::vector<std::size_t> find_boundaries(std::string_view content) const override;
  void apply_overlap(std::vector<DocumentChunk> &chunks, std::string_view original) const override;

private:
  ChunkingConfig config_;
};

// Groups whole sentences; a sentence longer than the limit is cut like a
// fixed-size window.
class SentenceChunker final : public IChunker {
public:
  explicit SentenceChunker(ChunkingConfig config);

  [[nodiscard]] std::string_view name() const override { return "sentence_boundary"; }
  [[nodiscard]] ChunkStrategy strategy() const override {
    return ChunkStrategy::SentenceBoundary;
  }
  [[nodiscard]] common::Result<std::vector<DocumentChunk>>
  chunk(std::string_view content) const override;
  [[nodiscard]] std::vector<std::size_t> find_boundaries(std::string_view content) const override;
  void apply_overlap(std::vector<DocumentChunk> &chunks, std::string_view original) const override;

private:
  ChunkingConfig config_;
};

// Groups paragraphs separated by "\n\n". Paragraphs are never split, so a
// single oversized paragraph becomes an oversized chunk.
class ParagraphChunker final : public IChunker {
public:
  explicit ParagraphChunker(ChunkingConfig config);

  [[nodiscard]] std::string_view name() const override { return "paragraph_boundary"; }
  [[nodiscard]] ChunkStrategy strategy() const override {
    return ChunkStrategy::ParagraphBoundary;
  }
  [[nodiscard]] common::Result<std::vector<DocumentChunk>>
  chunk(std::string_view content) const override;
  [[nodiscard]] std::vector<std::size_t> find_boundaries(std::string_view content) const override;
  void apply_overlap(std::vector<DocumentChunk> &chunks, std::string_view original) const override;

private:
  ChunkingConfig config_;
};

[[nodiscard]] common::Result<std::unique_ptr<IChunker>> create_chunker(const ChunkingConfig &config);

// Shared by the strategies.
[[nodiscard]] common::Status require_valid_text(std::string_view content);
[[nodiscard]] DocumentChunk make_chunk(std::string_view source, ByteRange range,
                                       std::size_t index,
                                       const std::vector<std::size_t> &char_table);
// Assigns random ids and back-fills total_chunks.
[[nodiscard]] common::Status finalize_chunks(std::vector<DocumentChunk> &chunks);
// Byte offsets in [begin, end) where fixed-size windows start.
[[nodiscard]] std::vector<std::size_t> fixed_window_starts(const std::vector<std::size_t> &char_table,
                                                           std::size_t begin, std::size_t end,
                                                           std::size_t max_bytes);
// Extends every chunk after the first backwards into its predecessor by at
// most overlap_size bytes, ending on a codepoint boundary. Assumes the chunks
// tile the source contiguously.
void apply_trailing_overlap(std::vector<DocumentChunk> &chunks, std::string_view original,
                            std::size_t overlap_size);

} // namespace fileweave::chunking
