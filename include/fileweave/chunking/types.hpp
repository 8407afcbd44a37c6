#pragma once

#include "fileweave/common/result.hpp"
#include "fileweave/config/schema.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fileweave::chunking {

enum class ChunkStrategy {
  FixedSize,
  SentenceBoundary,
  ParagraphBoundary,
  ConversationBreak,
  HtmlStructureAware,
  SemanticSimilarity,
};

enum class DocumentFormat {
  PlainText,
  Markdown,
  Html,
  DiscordHtml,
  Json,
};

[[nodiscard]] std::string chunk_strategy_to_string(ChunkStrategy strategy);
// Accepts snake_case ("fixed_size") and CamelCase ("FixedSize") names.
[[nodiscard]] common::Result<ChunkStrategy> chunk_strategy_from_string(std::string_view value);
[[nodiscard]] std::string document_format_to_string(DocumentFormat format);
[[nodiscard]] common::Result<DocumentFormat> document_format_from_string(std::string_view value);

struct ChunkingConfig {
  std::size_t max_chunk_size = 2000;
  std::size_t overlap_size = 200;
  ChunkStrategy strategy = ChunkStrategy::SentenceBoundary;
  bool preserve_metadata = true;
  DocumentFormat format = DocumentFormat::PlainText;

  // max_chunk_size must be positive and strictly larger than overlap_size.
  [[nodiscard]] common::Status validate() const;

  [[nodiscard]] static common::Result<ChunkingConfig>
  from_settings(const config::ChunkingSettings &settings);
};

using ByteRange = std::pair<std::size_t, std::size_t>;
using CharRange = std::pair<std::size_t, std::size_t>;

struct ChunkMetadata {
  std::optional<std::string> source_file;
  std::size_t chunk_index = 0;
  std::size_t total_chunks = 0;
  // Half-open offsets into the source content; both ends sit on codepoint
  // boundaries.
  ByteRange byte_range{0, 0};
  CharRange char_range{0, 0};
  std::optional<std::pair<std::string, std::string>> timestamp_range;
  std::vector<std::string> participants;
  std::vector<std::string> topics;
  std::optional<std::string> parent_chunk;
  std::vector<std::string> child_chunks;
};

struct DocumentChunk {
  std::string id;
  std::string content;
  std::string content_hash;
  ChunkMetadata metadata;
};

} // namespace fileweave::chunking
