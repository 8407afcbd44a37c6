#include "fileweave/chunking/chunker.hpp"

#include "fileweave/common/utf8.hpp"

namespace fileweave::chunking {

namespace {

bool is_terminator(const char ch) { return ch == '.' || ch == '!' || ch == '?'; }

bool is_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

// Sentences tile the text: each one runs through its terminators and the
// whitespace that follows them.
std::vector<ByteRange> split_sentence_spans(const std::string_view text) {
  std::vector<ByteRange> spans;
  std::size_t start = 0;
  std::size_t i = 0;
  while (i < text.size()) {
    if (!is_terminator(text[i])) {
      ++i;
      continue;
    }
    std::size_t end = i;
    while (end < text.size() && is_terminator(text[end])) {
      ++end;
    }
    if (end < text.size() && !is_space(text[end])) {
      i = end;
      continue;
    }
    while (end < text.size() && is_space(text[end])) {
      ++end;
    }
    spans.push_back({start, end});
    start = end;
    i = end;
  }
  if (start < text.size()) {
    spans.push_back({start, text.size()});
  }
  return spans;
}

} // namespace

SentenceChunker::SentenceChunker(ChunkingConfig config) : config_(config) {}

std::vector<std::size_t> SentenceChunker::find_boundaries(const std::string_view content) const {
  std::vector<std::size_t> boundaries;
  for (const auto &span : split_sentence_spans(content)) {
    boundaries.push_back(span.first);
  }
  boundaries.push_back(content.size());
  return boundaries;
}

common::Result<std::vector<DocumentChunk>>
SentenceChunker::chunk(const std::string_view content) const {
  if (auto valid = require_valid_text(content); !valid.ok()) {
    return common::Result<std::vector<DocumentChunk>>::failure(valid.error_info());
  }

  const auto char_table = common::char_boundaries(content);
  const std::size_t max = config_.max_chunk_size;
  std::vector<DocumentChunk> chunks;
  std::optional<ByteRange> current;

  auto emit = [&](const ByteRange range) {
    chunks.push_back(make_chunk(content, range, chunks.size(), char_table));
  };

  for (const auto &span : split_sentence_spans(content)) {
    if (current.has_value() && span.second - current->first <= max) {
      current->second = span.second;
      continue;
    }
    if (current.has_value()) {
      emit(*current);
      current.reset();
    }
    if (span.second - span.first <= max) {
      current = span;
      continue;
    }

    const auto starts = fixed_window_starts(char_table, span.first, span.second, max);
    for (std::size_t i = 0; i < starts.size(); ++i) {
      const std::size_t end = i + 1 < starts.size() ? starts[i + 1] : span.second;
      emit({starts[i], end});
    }
  }
  if (current.has_value()) {
    emit(*current);
  }

  apply_overlap(chunks, content);
  if (auto finalized = finalize_chunks(chunks); !finalized.ok()) {
    return common::Result<std::vector<DocumentChunk>>::failure(finalized.error_info());
  }
  return common::Result<std::vector<DocumentChunk>>::success(std::move(chunks));
}

void SentenceChunker::apply_overlap(std::vector<DocumentChunk> &chunks,
                                    const std::string_view original) const {
  apply_trailing_overlap(chunks, original, config_.overlap_size);
}

} // namespace fileweave::chunking
