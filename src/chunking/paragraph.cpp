#include "fileweave/chunking/chunker.hpp"

#include "fileweave/common/hash.hpp"
#include "fileweave/common/utf8.hpp"

namespace fileweave::chunking {

namespace {

constexpr std::string_view PARAGRAPH_SEPARATOR = "\n\n";

bool is_blank(const std::string_view text) {
  return text.find_first_not_of(" \t\r\n\f\v") == std::string_view::npos;
}

// Byte spans of the non-blank paragraphs, separators excluded.
std::vector<ByteRange> split_paragraph_spans(const std::string_view text) {
  std::vector<ByteRange> spans;
  std::size_t start = 0;
  while (start <= text.size()) {
    const auto separator = text.find(PARAGRAPH_SEPARATOR, start);
    const std::size_t end = separator == std::string_view::npos ? text.size() : separator;
    if (!is_blank(text.substr(start, end - start))) {
      spans.push_back({start, end});
    }
    if (separator == std::string_view::npos) {
      break;
    }
    start = separator + PARAGRAPH_SEPARATOR.size();
  }
  return spans;
}

std::string_view trailing_paragraph(const std::string_view chunk_source) {
  const auto separator = chunk_source.rfind(PARAGRAPH_SEPARATOR);
  if (separator == std::string_view::npos) {
    return chunk_source;
  }
  return chunk_source.substr(separator + PARAGRAPH_SEPARATOR.size());
}

} // namespace

ParagraphChunker::ParagraphChunker(ChunkingConfig config) : config_(config) {}

std::vector<std::size_t> ParagraphChunker::find_boundaries(const std::string_view content) const {
  std::vector<std::size_t> boundaries;
  for (const auto &span : split_paragraph_spans(content)) {
    boundaries.push_back(span.first);
  }
  boundaries.push_back(content.size());
  return boundaries;
}

common::Result<std::vector<DocumentChunk>>
ParagraphChunker::chunk(const std::string_view content) const {
  if (auto valid = require_valid_text(content); !valid.ok()) {
    return common::Result<std::vector<DocumentChunk>>::failure(valid.error_info());
  }

  const auto char_table = common::char_boundaries(content);
  std::vector<DocumentChunk> chunks;
  std::optional<ByteRange> current;

  for (const auto &span : split_paragraph_spans(content)) {
    if (current.has_value() && span.second - current->first <= config_.max_chunk_size) {
      current->second = span.second;
      continue;
    }
    if (current.has_value()) {
      chunks.push_back(make_chunk(content, *current, chunks.size(), char_table));
    }
    current = span;
  }
  if (current.has_value()) {
    chunks.push_back(make_chunk(content, *current, chunks.size(), char_table));
  }

  apply_overlap(chunks, content);
  if (auto finalized = finalize_chunks(chunks); !finalized.ok()) {
    return common::Result<std::vector<DocumentChunk>>::failure(finalized.error_info());
  }
  return common::Result<std::vector<DocumentChunk>>::success(std::move(chunks));
}

// The previous chunk's last paragraph is carried as a marked prefix. Byte
// ranges keep pointing at the chunk's own paragraphs.
void ParagraphChunker::apply_overlap(std::vector<DocumentChunk> &chunks,
                                     const std::string_view original) const {
  if (config_.overlap_size == 0) {
    return;
  }

  for (std::size_t i = chunks.size(); i-- > 1;) {
    const auto &previous = chunks[i - 1].metadata.byte_range;
    if (previous.second > original.size() || previous.first > previous.second) {
      continue;
    }
    const auto context =
        trailing_paragraph(original.substr(previous.first, previous.second - previous.first));
    if (context.empty() || context.size() > config_.overlap_size) {
      continue;
    }
    chunks[i].content = "[Context: " + std::string(context) + "]\n\n" + chunks[i].content;
    chunks[i].content_hash = common::sha256_hex(chunks[i].content);
  }
}

} // namespace fileweave::chunking
